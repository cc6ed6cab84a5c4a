#include "archivedir/pipeline.hpp"

#include "archivedir/byte_pipe.hpp"
#include "archivedir/errors.hpp"
#include "archivedir/log.hpp"

#include <condition_variable>
#include <exception>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <utility>

namespace archivedir::pipeline {

namespace {

constexpr std::chrono::milliseconds kSupervisorTick{20};

class RunState {
public:
    RunState(std::vector<std::unique_ptr<stream::BytePipe>>& pipes, stream::CancelToken& cancel,
             std::size_t workers)
        : pipes_(pipes), cancel_(cancel), workers_(workers) {}

    void Fail(std::exception_ptr error, const std::string& stage) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (failure_) {
                return;
            }
            failure_ = std::move(error);
        }
        log::Warn("pipeline: stage '" + stage + "' failed: " + Describe(failure_));
        cancel_.Cancel();
        for (auto& pipe : pipes_) {
            pipe->Abort();
        }
        cv_.notify_all();
    }

    void Finished() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++finished_;
        }
        cv_.notify_all();
    }

    // Waits for every worker, turning an external cancel into a failure.
    void Supervise() {
        std::unique_lock<std::mutex> lock(mutex_);
        while (finished_ < workers_) {
            cv_.wait_for(lock, kSupervisorTick);
            if (cancel_.IsCancelled() && !failure_) {
                lock.unlock();
                Fail(std::make_exception_ptr(archivedir::Cancelled("pipeline")), "pipeline");
                lock.lock();
            }
        }
    }

    std::exception_ptr failure() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return failure_;
    }

private:
    std::vector<std::unique_ptr<stream::BytePipe>>& pipes_;
    stream::CancelToken& cancel_;
    std::size_t workers_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::exception_ptr failure_;
    std::size_t finished_ = 0;
};

template <typename Fn>
void RunGuarded(RunState& state, const std::string& stage, Fn&& fn) {
    try {
        log::Debug("pipeline: stage '" + stage + "' started");
        fn();
        log::Debug("pipeline: stage '" + stage + "' reached end of stream");
    } catch (const archivedir::Error&) {
        state.Fail(std::current_exception(), stage);
    } catch (const std::exception& exc) {
        state.Fail(std::make_exception_ptr(StageError(stage, exc.what())), stage);
    } catch (...) {
        state.Fail(std::current_exception(), stage);
    }
    state.Finished();
}

}  // namespace

Pipeline::Pipeline(std::unique_ptr<stream::StreamSource> source,
                   std::vector<std::unique_ptr<stream::StreamTransform>> transforms,
                   stream::TerminalSink& terminal,
                   Options options)
    : source_(std::move(source)), transforms_(std::move(transforms)), terminal_(terminal), options_(options) {
    if (!source_) {
        throw std::invalid_argument("pipeline requires a source stage");
    }
    for (const auto& transform : transforms_) {
        if (!transform) {
            throw std::invalid_argument("pipeline transform is null");
        }
    }
    if (options_.chunk_size == 0) {
        options_.chunk_size = 1;
    }
}

std::vector<std::string> Pipeline::StageNames() const {
    std::vector<std::string> names;
    names.push_back(source_->Name());
    for (const auto& transform : transforms_) {
        names.push_back(transform->Name());
    }
    names.push_back(terminal_.Name());
    return names;
}

RunStats Pipeline::Run(stream::CancelToken& cancel) {
    if (ran_) {
        throw std::logic_error("pipeline already ran");
    }
    ran_ = true;
    auto started = std::chrono::steady_clock::now();

    // pipes_[i] carries the output of stage i
    std::vector<std::unique_ptr<stream::BytePipe>> pipes;
    pipes.push_back(std::make_unique<stream::BytePipe>(source_->Name(), options_.pipe_capacity));
    for (const auto& transform : transforms_) {
        pipes.push_back(std::make_unique<stream::BytePipe>(transform->Name(), options_.pipe_capacity));
    }

    const std::size_t workers = transforms_.size() + 2;
    RunState state(pipes, cancel, workers);
    std::uint64_t delivered = 0;
    std::vector<std::thread> threads;
    threads.reserve(workers);

    threads.emplace_back([this, &state, &pipes, &cancel] {
        RunGuarded(state, source_->Name(), [&] {
            source_->Produce(*pipes.front(), cancel);
            pipes.front()->Close();
        });
    });

    for (std::size_t i = 0; i < transforms_.size(); ++i) {
        threads.emplace_back([this, i, &state, &pipes] {
            stream::StreamTransform& transform = *transforms_[i];
            RunGuarded(state, transform.Name(), [&] {
                stream::BytePipe& input = *pipes[i];
                stream::BytePipe& output = *pipes[i + 1];
                stream::Bytes buffer(options_.chunk_size);
                for (;;) {
                    std::size_t n = input.Read(buffer.data(), buffer.size());
                    if (n == 0) {
                        break;
                    }
                    transform.Update(buffer.data(), n, output);
                }
                transform.Finish(output);
                output.Close();
            });
        });
    }

    threads.emplace_back([this, &state, &pipes, &delivered] {
        RunGuarded(state, terminal_.Name(), [&] {
            stream::BytePipe& input = *pipes.back();
            stream::Bytes buffer(options_.chunk_size);
            for (;;) {
                std::size_t n = input.Read(buffer.data(), buffer.size());
                if (n == 0) {
                    break;
                }
                terminal_.Write(buffer.data(), n);
                delivered += n;
            }
            terminal_.Close();
        });
    });

    state.Supervise();
    for (auto& thread : threads) {
        thread.join();
    }

    if (std::exception_ptr failure = state.failure()) {
        terminal_.Abort();
        std::rethrow_exception(failure);
    }

    for (const auto& pipe : pipes) {
        if (pipe->bytes_written() != pipe->bytes_read()) {
            terminal_.Abort();
            throw StageError(pipe->name(), "byte count mismatch after '" + pipe->name() + "': " +
                                               std::to_string(pipe->bytes_written()) + " written, " +
                                               std::to_string(pipe->bytes_read()) + " consumed");
        }
    }
    if (delivered != pipes.back()->bytes_read()) {
        terminal_.Abort();
        throw StageError(terminal_.Name(), "terminal sink received " + std::to_string(delivered) +
                                               " of " + std::to_string(pipes.back()->bytes_read()) + " bytes");
    }

    RunStats stats;
    stats.stages.push_back({source_->Name(), 0, pipes.front()->bytes_written()});
    for (std::size_t i = 0; i < transforms_.size(); ++i) {
        stats.stages.push_back({transforms_[i]->Name(), pipes[i]->bytes_read(), pipes[i + 1]->bytes_written()});
    }
    stats.stages.push_back({terminal_.Name(), delivered, delivered});
    stats.bytes_delivered = delivered;
    stats.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    return stats;
}

}  // namespace archivedir::pipeline
