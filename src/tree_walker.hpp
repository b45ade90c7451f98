#pragma once

#include "error.hpp"
#include "fs_ops.hpp"
#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/error_code.hpp>
#include <asio/experimental/concurrent_channel.hpp>
#include <asio/post.hpp>
#include <asio/this_coro.hpp>
#include <asio/use_awaitable.hpp>
#include <asio/use_future.hpp>
#include <spdlog/spdlog.h>
#include <exception>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace dotsmith {

// What to do at each node of a tree rooted at source_root. All callbacks take
// the path relative to the root and report failures by throwing located_exception.
template <typename T>
struct walk_plan {
    // Used in log lines ("build", "link", ...)
    std::string name;

    std::filesystem::path source_root;

    // Runs before a directory is listed, e.g. to create its mirror. Optional.
    std::function<void(const std::filesystem::path&)> enter_dir;

    // Runs once per regular file.
    std::function<T(const std::filesystem::path&)> visit_file;

    // Folds a successful child result into its parent's accumulator.
    std::function<void(T&, T&&)> merge;
};

// Converts an exception escaping a traversal task into a located error.
inline located_error describe_exception(std::exception_ptr ep, const std::filesystem::path& location) {
    try {
        std::rethrow_exception(ep);
    } catch (const located_exception& e) {
        return e.error();
    } catch (const std::exception& e) {
        return {location, error_kind::internal, e.what()};
    } catch (...) {
        return {location, error_kind::internal, "unknown exception"};
    }
}

// Recursive concurrent traversal. Every subdirectory and every file of a
// directory becomes its own task on the executor; the directory's coroutine
// collects their results and merges them. A failing file or subtree never
// stops its siblings, so one walk reports every independent failure.
//
// Directory entries that are neither directories nor regular files
// (symlinks, sockets, ...) are skipped.
template <typename T>
class tree_walker {
public:
    tree_walker(asio::any_io_executor executor, walk_plan<T> plan,
                std::shared_ptr<spdlog::logger> log)
        : m_executor(std::move(executor)), m_plan(std::move(plan)), m_log(std::move(log))
    {}

    // Walks the tree below `relative` and blocks until every task has
    // finished. Must not be called from a thread of the executor.
    walk_result<T> run(const std::filesystem::path& relative = {}) {
        auto done = asio::co_spawn(m_executor, walk(relative), asio::use_future);
        return done.get();
    }

    asio::awaitable<walk_result<T>> walk(std::filesystem::path relative) {
        co_await asio::post(co_await asio::this_coro::executor, asio::use_awaitable);

        const std::filesystem::path source = join_relative(m_plan.source_root, relative);
        m_log->info("{}: traversing \"{}\"", m_plan.name, source.string());

        walk_result<T> out;

        if (m_plan.enter_dir) {
            bool entered = true;
            try {
                m_plan.enter_dir(relative);
            } catch (const located_exception& e) {
                out.errors.add(e.error());
                entered = false;
            }
            if (!entered) co_return out;
        }

        std::vector<std::filesystem::path> dirs;
        std::vector<std::filesystem::path> files;

        std::error_code ec;
        std::filesystem::directory_iterator it(source, ec);
        const std::filesystem::directory_iterator end;
        for (; !ec && it != end; it.increment(ec)) {
            std::error_code status_ec;
            auto status = it->symlink_status(status_ec);
            if (status_ec) {
                out.errors.add(io_error(it->path(), status_ec));
                continue;
            }

            auto child = relative / it->path().filename();
            if (std::filesystem::is_directory(status)) {
                dirs.push_back(std::move(child));
            } else if (std::filesystem::is_regular_file(status)) {
                files.push_back(std::move(child));
            } else {
                m_log->debug("{}: skipping \"{}\"", m_plan.name, it->path().string());
            }
        }

        // Nothing at this level runs if the listing failed.
        if (ec) {
            co_return walk_result<T>{T{}, error_collection(io_error(source, ec))};
        }

        const std::size_t pending = dirs.size() + files.size();
        if (pending == 0) co_return out;

        auto executor = co_await asio::this_coro::executor;
        auto channel = std::make_shared<result_channel>(executor, pending);

        for (auto& dir : dirs) {
            spawn(executor, walk(dir), m_plan.source_root / dir, channel);
        }
        for (auto& file : files) {
            spawn(executor, visit(file), m_plan.source_root / file, channel);
        }

        for (std::size_t i = 0; i < pending; ++i) {
            auto child = co_await channel->async_receive(asio::use_awaitable);
            if (child.errors.empty()) {
                m_plan.merge(out.value, std::move(child.value));
            } else {
                out.errors.merge(std::move(child.errors));
            }
        }

        co_return out;
    }

private:
    using result_channel =
        asio::experimental::concurrent_channel<void(asio::error_code, walk_result<T>)>;

    asio::awaitable<walk_result<T>> visit(std::filesystem::path relative) {
        co_await asio::post(co_await asio::this_coro::executor, asio::use_awaitable);

        walk_result<T> out;
        try {
            out.value = m_plan.visit_file(relative);
        } catch (const located_exception& e) {
            out.errors.add(e.error());
        } catch (const std::exception& e) {
            out.errors.add({m_plan.source_root / relative, error_kind::internal, e.what()});
        }
        co_return out;
    }

    // Runs `task` concurrently and delivers its result (or the exception it
    // escaped with) to `channel`.
    void spawn(const asio::any_io_executor& executor,
               asio::awaitable<walk_result<T>> task,
               std::filesystem::path location,
               std::shared_ptr<result_channel> channel) {
        asio::co_spawn(executor, std::move(task),
            [channel = std::move(channel), location = std::move(location)](
                std::exception_ptr ep, walk_result<T> result) {
                if (ep) result.errors.add(describe_exception(ep, location));
                channel->async_send(asio::error_code{}, std::move(result), asio::detached);
            });
    }

    asio::any_io_executor m_executor;
    walk_plan<T> m_plan;
    std::shared_ptr<spdlog::logger> m_log;
};

} // namespace dotsmith
