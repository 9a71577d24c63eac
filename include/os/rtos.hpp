#pragma once
#include <cstddef> // Required for size_t
#include <cstdint>

namespace Rtos {

// Timeout value meaning "block until the operation can complete".
static constexpr uint32_t MAX_TIMEOUT = 0xFFFFFFFFu;

void SleepMs(int ms);

// Monotonic clock, shared by every task so timestamps are comparable.
uint64_t NowUs();
inline uint64_t NowMs() { return NowUs() / 1000ull; }

//== Task abstraction ==//
// This class provides a simple task wrapper
class Task {
public:
    Task();
    ~Task();

    bool Create(const char* name, void (*fn)(void*), void* arg);
    void Join();

private:
    struct TaskHandle;
    TaskHandle* handle_;
};

//== Mutex abstraction ==//
// This class provides a simple mutex wrapper

class Mutex {
public:
    Mutex();
    ~Mutex();

    void lock();
    void unlock();

private:
    struct MutexHandle;
    MutexHandle* handle_;
};

//== Binary Semaphore abstraction ==//
class BinarySemaphore {
public:
    BinarySemaphore();
    ~BinarySemaphore();

    void take();                        // Blocks until available
    bool take(uint32_t timeout_ms);     // false on timeout
    bool try_take();                    // Non-blocking
    void give();                        // Releases the semaphore

private:
    struct SemaphoreHandle;
    SemaphoreHandle* handle_;
};


//== Counting Semaphore abstraction ==//
class CountingSemaphore {
public:
    /**
     * @param maxCount    Maximum count (e.g. queue capacity)
     * @param initialCount  Starting count
     */
    CountingSemaphore(size_t maxCount, size_t initialCount);
    ~CountingSemaphore();

    void take();                      // block until count>0, then --count
    bool take(uint32_t timeout_ms);   // as take(), false on timeout
    bool try_take();                  // non-blocking: if count>0 then --count, else false
    void give();                      // ++count, wake one waiter if present

private:
    struct CountingSemHandle;
    CountingSemHandle* handle_;
};

//== Queue abstraction ==//
// Fixed-size statically allocated queue on a circular buffer, synchronised
// with the OSAL Mutex and CountingSemaphore primitives.
//
// Two flavours, chosen at construction:
//  - overwrite = false: send() blocks (up to the timeout) while the queue is
//    full. Used for anything that must never be dropped (frame releases,
//    commands, step events).
//  - overwrite = true: send() never blocks; when full the OLDEST item is
//    replaced. Used for freshest-wins channels (live frames, status).
//    wasLastSendOverwritten() tells the producer that an unconsumed item
//    was discarded, so it can reclaim whatever that item referred to.
//
// Only the producer thread may call wasLastSendOverwritten().
template <typename T, size_t Capacity>
class Queue {
public:
    explicit Queue(bool overwrite = false)
        : head(0), tail(0), m_overwrite(overwrite), m_last_overwritten(false) {}

    bool send(const T& item, uint32_t timeout_ms = MAX_TIMEOUT) {
        if (m_overwrite) {
            pushOverwrite(item);
            return true;
        }
        if (timeout_ms == MAX_TIMEOUT) {
            spaceAvailable.take();
        } else if (!spaceAvailable.take(timeout_ms)) {
            return false;
        }
        push(item);
        return true;
    }

    bool try_send(const T& item) {
        if (m_overwrite) {
            pushOverwrite(item);
            return true;
        }
        if (!spaceAvailable.try_take()) return false;
        push(item);
        return true;
    }

    bool receive(T& item, uint32_t timeout_ms = MAX_TIMEOUT) {
        if (timeout_ms == MAX_TIMEOUT) {
            dataAvailable.take();
        } else if (!dataAvailable.take(timeout_ms)) {
            return false;
        }
        pop(item);
        return true;
    }

    bool try_receive(T& item) {
        if (!dataAvailable.try_take()) return false;
        pop(item);
        return true;
    }

    bool wasLastSendOverwritten() const { return m_last_overwritten; }

private:
    void push(const T& item) {
        lock.lock();
        buffer[head] = item;
        head = (head + 1) % Capacity;
        m_last_overwritten = false;
        lock.unlock();
        dataAvailable.give();   // Signal data is available
    }

    void pushOverwrite(const T& item) {
        lock.lock();
        if (spaceAvailable.try_take()) {
            buffer[head] = item;
            head = (head + 1) % Capacity;
            m_last_overwritten = false;
            lock.unlock();
            dataAvailable.give();
            return;
        }
        // Full: drop the oldest slot, item count is unchanged.
        tail = (tail + 1) % Capacity;
        buffer[head] = item;
        head = (head + 1) % Capacity;
        m_last_overwritten = true;
        lock.unlock();
    }

    void pop(T& item) {
        lock.lock();
        item = buffer[tail];
        tail = (tail + 1) % Capacity;
        lock.unlock();
        spaceAvailable.give(); // Signal space is available
    }

    T buffer[Capacity];
    size_t head, tail;
    bool m_overwrite;
    bool m_last_overwritten;

    Mutex lock;
    CountingSemaphore spaceAvailable{Capacity, Capacity};  // Initially full space
    CountingSemaphore dataAvailable{Capacity, 0};          // Initially no data
};
} // namespace Rtos
