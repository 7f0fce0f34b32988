/**
 * @file concurrent.cpp
 * @brief Fork-join executor
 */

#include "restful/client/concurrent.hpp"

#include <restful/common/debug.hpp>

#include <system_error>
#include <thread>

namespace restful::client {

using namespace common::debug;
using common::ErrorCode;

std::shared_ptr<FutureResponse> Concurrent::execute(Method method, std::string url,
                                                    RequestBody body, RequestOptions options) {
    auto future = std::make_shared<FutureResponse>();

    auto task = [this, future, method, url = std::move(url), body = std::move(body),
                 options = std::move(options)] {
        try {
            future->set(builder_.execute(method, url, body, options));
        } catch (const std::exception& e) {
            RESTFUL_LOG_ERROR(category::GENERAL, "request to " << url << " threw: " << e.what());
            future->set(std::make_shared<Response>(
                Response::failure(common::Error(ErrorCode::UNKNOWN_ERROR, std::string(e.what())))));
        }
    };

    std::lock_guard lock(mutex_);
    tasks_.push_back(std::move(task));
    return future;
}

void Concurrent::join() {
    std::vector<std::function<void()>> tasks;
    {
        std::lock_guard lock(mutex_);
        tasks.swap(tasks_);
    }
    if (tasks.empty()) {
        return;
    }

    std::vector<std::thread> workers;
    workers.reserve(tasks.size());
    for (auto& task : tasks) {
        try {
            workers.emplace_back(task);
        } catch (const std::system_error& e) {
            RESTFUL_LOG_WARN(category::GENERAL,
                             "cannot start worker thread (" << e.what() << "), running inline");
            task();
        }
    }
    for (auto& worker : workers) {
        worker.join();
    }
}

size_t Concurrent::pending() const {
    std::lock_guard lock(mutex_);
    return tasks_.size();
}

void fork_join(const RequestBuilder& builder, const std::function<void(Concurrent&)>& fn) {
    Concurrent concurrent(builder);
    fn(concurrent);
    concurrent.join();
}

}  // namespace restful::client
