#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace runner {

/**
 * @brief 并发运行数量的准入控制
 * 在沙箱执行之前获取一个名额，执行结束后归还，从而限制同时运行的沙箱进程数量，
 * 避免宿主机资源耗尽。名额用完时 acquire 阻塞等待。
 */
struct admission_gate {
    /**
     * @brief 持有一个运行名额，析构时归还
     */
    struct ticket {
        ticket() : gate(nullptr) {}
        explicit ticket(admission_gate *gate) : gate(gate) {}
        ticket(ticket &&other) : gate(other.gate) { other.gate = nullptr; }
        ticket &operator=(ticket &&other) {
            if (this != &other) {
                release();
                gate = other.gate;
                other.gate = nullptr;
            }
            return *this;
        }
        ~ticket() { release(); }

        void release() {
            if (gate) gate->release();
            gate = nullptr;
        }

    private:
        admission_gate *gate;
    };

    /**
     * @param capacity 允许同时运行的数量，至少为 1
     */
    explicit admission_gate(size_t capacity) : capacity(capacity ? capacity : 1), used(0) {}

    admission_gate(const admission_gate &) = delete;
    admission_gate &operator=(const admission_gate &) = delete;

    /**
     * @brief 获取一个名额，如果名额已满则阻塞等待直到有名额被归还为止
     */
    ticket acquire() {
        std::unique_lock<std::mutex> lock(mut);
        cond.wait(lock, [this] { return used < capacity; });
        ++used;
        return ticket(this);
    }

    /**
     * @brief 当前正在使用的名额数量
     */
    size_t in_use() {
        std::unique_lock<std::mutex> lock(mut);
        return used;
    }

    size_t get_capacity() const { return capacity; }

private:
    void release() {
        std::unique_lock<std::mutex> lock(mut);
        --used;
        lock.unlock();
        cond.notify_one();
    }

    const size_t capacity;
    size_t used;
    std::mutex mut;
    std::condition_variable cond;
};

}  // namespace runner
