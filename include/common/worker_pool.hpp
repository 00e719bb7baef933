#pragma once

#include <functional>
#include <thread>
#include <vector>
#include "common/concurrent_queue.hpp"

namespace codejudge {

/**
 * @brief 固定大小的 worker 线程池
 * 整个进程共享一个线程池，线程数就是同时运行的沙箱数量的上限。
 * 每个评测请求将测试点拆解成子任务放入任务队列，空闲的 worker 从队列中取出子任务执行，
 * 因此无论同时有多少个请求，启动的容器数量都不会超过 worker 数量。
 *
 * 注意不要在 worker 线程中提交任务后阻塞等待任务完成，否则可能所有 worker 都在等待而死锁。
 */
struct worker_pool {
    /**
     * @param size worker 线程数，至少为 1
     */
    explicit worker_pool(std::size_t size);

    /**
     * @brief 停止接受新任务，等待队列中所有任务执行完成后退出所有 worker
     */
    ~worker_pool();

    /**
     * @brief 提交一个任务
     * @return false 若线程池已经停止，此时任务不会被执行
     */
    bool submit(std::function<void()> task);

    /**
     * @brief 停止接受新任务并等待所有 worker 退出
     */
    void shutdown();

    std::size_t size() const;

private:
    concurrent_queue<std::function<void()>> task_queue;
    std::vector<std::thread> workers;
};

}  // namespace codejudge
