#include "common/worker_pool.hpp"
#include <glog/logging.h>
#include <algorithm>

namespace codejudge {
using namespace std;

/**
 * @brief worker 线程函数
 * 从任务队列中取出任务执行，队列关闭且为空时退出。
 * 任务自己负责处理异常，这里只是避免异常导致整个进程退出。
 */
static void worker_loop(size_t worker_id, concurrent_queue<function<void()>> &task_queue) {
    DLOG(INFO) << "Worker " << worker_id << " started";

    function<void()> task;
    while (task_queue.pop(task)) {
        try {
            task();
        } catch (std::exception &ex) {
            LOG(ERROR) << "Worker " << worker_id << " has crashed when executing task, " << ex.what();
        }
        task = nullptr;
    }

    DLOG(INFO) << "Worker " << worker_id << " stopped";
}

worker_pool::worker_pool(size_t size) {
    size = max<size_t>(size, 1);
    for (size_t i = 0; i < size; ++i)
        workers.emplace_back(worker_loop, i, ref(task_queue));
}

worker_pool::~worker_pool() {
    shutdown();
}

bool worker_pool::submit(function<void()> task) {
    return task_queue.push(move(task));
}

void worker_pool::shutdown() {
    task_queue.close();
    for (auto &th : workers)
        if (th.joinable()) th.join();
}

size_t worker_pool::size() const {
    return workers.size();
}

}  // namespace codejudge
