// src/evaluator/Async/HostLoop.cpp
#include "HostLoop.hpp"

#include <cmath>

#include "conversions.hpp"

HostLoop::HostLoop(size_t steps_per_tick)
    : steps_per_tick_(steps_per_tick ? steps_per_tick : 1) {
    loop_ = new uv_loop_t;
    uv_loop_init(loop_);
    uv_idle_init(loop_, &idle_);
    idle_.data = this;
}

HostLoop::~HostLoop() {
    cancel_all_timers();
    if (idling_) uv_idle_stop(&idle_);
    uv_close(reinterpret_cast<uv_handle_t*>(&idle_), nullptr);
    // let the close callbacks run before tearing the loop down
    uv_run(loop_, UV_RUN_NOWAIT);
    uv_loop_close(loop_);
    delete loop_;
}

void HostLoop::install_timer_natives(Evaluator& engine) {
    ObjectPtr global = engine.global_object();

    engine.register_native(global, "setTimeout", [this](NativeCall& call) -> Value {
        auto fn = as_function(call.arg(0));
        if (!fn) call.throw_error("TypeError", "setTimeout expects a function as its first argument");
        std::vector<Value> rest;
        if (call.argc() > 2) rest.assign(call.args().begin() + 2, call.args().end());
        return static_cast<double>(start_timer(to_number(call.arg(1)), false, fn, std::move(rest)));
    }, 2);

    engine.register_native(global, "clearTimeout", [this](NativeCall& call) -> Value {
        double id = to_number(call.arg(0));
        if (std::isfinite(id) && id > 0) cancel_timer(static_cast<uint64_t>(id));
        return Value{};
    }, 1);

    engine.register_native(global, "sleep", [this](NativeCall& call) -> Value {
        start_timer(to_number(call.arg(0)), true, nullptr, {});
        call.suspend();
        return Value{};
    }, 1);
}

void HostLoop::drive(Evaluator& engine) {
    engine_ = &engine;
    error_ = nullptr;
    engine.log(LogLevel::Debug, "host loop: " + std::to_string(steps_per_tick_) + " steps per tick");

    update_idle();
    uv_run(loop_, UV_RUN_DEFAULT);

    engine_ = nullptr;
    if (error_) {
        std::exception_ptr error = error_;
        error_ = nullptr;
        std::rethrow_exception(error);
    }
}

// ----------------- callbacks -----------------

void HostLoop::on_idle(uv_idle_t* handle) {
    HostLoop* self = static_cast<HostLoop*>(handle->data);
    Evaluator& engine = *self->engine_;
    ++self->ticks_;
    try {
        for (size_t i = 0; i < self->steps_per_tick_; ++i) {
            bool more = engine.step();
            if (!more || engine.status() == EngineStatus::SuspendedAwait) break;
        }
    } catch (const std::exception&) {
        self->fail(std::current_exception());
        return;
    }
    self->update_idle();
}

void HostLoop::on_timer(uv_timer_t* handle) {
    Timer* timer = static_cast<Timer*>(handle->data);
    HostLoop* self = timer->owner;
    Evaluator* engine = self->engine_;

    bool resumes_sleeper = timer->resumes_sleeper;
    FunctionPtr fn = std::move(timer->fn);
    std::vector<Value> args = std::move(timer->args);
    self->cancel_timer(timer->id);
    if (!engine) return;

    try {
        if (resumes_sleeper) {
            engine->resume(Value{});
        } else {
            engine->queue_call(fn, std::move(args));
        }
    } catch (const std::exception&) {
        self->fail(std::current_exception());
        return;
    }
    self->update_idle();
}

// ----------------- timers -----------------

uint64_t HostLoop::start_timer(double ms, bool resumes_sleeper, FunctionPtr fn, std::vector<Value> args) {
    if (!std::isfinite(ms) || ms < 0) ms = 0;

    Timer* timer = new Timer;
    timer->owner = this;
    timer->id = next_timer_id_++;
    timer->resumes_sleeper = resumes_sleeper;
    timer->fn = std::move(fn);
    timer->args = std::move(args);

    int r = uv_timer_init(loop_, &timer->handle);
    if (r != 0) {
        delete timer;
        throw SandstepError("HostError", std::string("uv_timer_init failed: ") + uv_strerror(r));
    }
    timer->handle.data = timer;
    uv_timer_start(&timer->handle, on_timer, static_cast<uint64_t>(ms), 0);
    timers_[timer->id] = timer;
    return timer->id;
}

void HostLoop::cancel_timer(uint64_t id) {
    auto it = timers_.find(id);
    if (it == timers_.end()) return;
    Timer* timer = it->second;
    timers_.erase(it);
    uv_timer_stop(&timer->handle);
    // handle memory must stay valid until libuv is done with it
    uv_close(reinterpret_cast<uv_handle_t*>(&timer->handle), [](uv_handle_t* h) {
        delete static_cast<Timer*>(h->data);
    });
}

void HostLoop::cancel_all_timers() {
    while (!timers_.empty()) cancel_timer(timers_.begin()->first);
}

// Idle only while the engine can make progress on its own.
void HostLoop::update_idle() {
    EngineStatus status = engine_ ? engine_->status() : EngineStatus::Completed;
    bool runnable = status == EngineStatus::Idle || status == EngineStatus::SuspendedYield;
    if (runnable && !idling_) {
        uv_idle_start(&idle_, on_idle);
        idling_ = true;
    } else if (!runnable && idling_) {
        uv_idle_stop(&idle_);
        idling_ = false;
    }
}

void HostLoop::fail(std::exception_ptr error) {
    error_ = std::move(error);
    cancel_all_timers();
    if (idling_) {
        uv_idle_stop(&idle_);
        idling_ = false;
    }
}
