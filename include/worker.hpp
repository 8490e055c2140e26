#pragma once

#include <functional>
#include <thread>
#include "common/concurrent_queue.hpp"
#include "common/messages.hpp"
#include "monitor/monitor.hpp"

/**
 * 评测 worker 相关函数
 * 调度器持有等待队列和空闲槽位计数，每个 worker 是一个执行槽位。
 * worker 从任务队列中取出提交，在新的沙箱中执行，将结果放入结果队列，
 * 然后继续等待下一个任务，直到收到停止消息为止。
 * worker 之间不共享任何状态，只通过队列和调度器通信。
 */
namespace grader {

/**
 * @brief worker 执行一个提交的方式，通常是绑定了沙箱提供者和评测器的 run_submission
 * 返回时沙箱必须已经被释放
 */
using job_runner = std::function<execution_outcome(const submission_job &)>;

/**
 * @brief 启动评测 worker 线程
 * @param worker_id worker 编号
 * @param task_queue 调度器发送评测任务的队列
 * @param result_queue worker 返回执行结果的队列
 * @param runner 执行提交的函数
 * @param monitors 监控器
 * @return 产生的线程
 */
std::thread start_worker(int worker_id, concurrent_queue<message::dispatch> &task_queue,
                         concurrent_queue<message::report> &result_queue,
                         job_runner runner, monitor_list monitors);

}  // namespace grader
