#pragma once

#ifndef SANDSTEP_HOST_LOOP_HPP
#define SANDSTEP_HOST_LOOP_HPP

#include <cstdint>
#include <exception>
#include <map>
#include <vector>

#include "evaluator.hpp"

// libuv (use local header path)
#include "uv.h"

// Drives an Evaluator from a libuv loop: a bounded number of steps per loop
// tick from an idle handle, with uv timers delivering deferred results.
class HostLoop {
   public:
    explicit HostLoop(size_t steps_per_tick = 64);
    ~HostLoop();

    HostLoop(const HostLoop&) = delete;
    HostLoop& operator=(const HostLoop&) = delete;

    // setTimeout, clearTimeout and sleep on the engine's global object. The
    // natives reference this loop, which must outlive the engine's use of them.
    void install_timer_natives(Evaluator& engine);

    // Runs until the engine completes with no timers pending, or fails.
    // Whatever step() threw is rethrown here.
    void drive(Evaluator& engine);

    size_t steps_per_tick() const { return steps_per_tick_; }
    size_t active_timers() const { return timers_.size(); }
    uint64_t ticks() const { return ticks_; }
    uv_loop_t* get_uv_loop() { return loop_; }

   private:
    struct Timer {
        HostLoop* owner = nullptr;
        uint64_t id = 0;
        uv_timer_t handle;
        bool resumes_sleeper = false;  // sleep(): resume(undefined) instead of a queued call
        FunctionPtr fn;
        std::vector<Value> args;
    };

    uv_loop_t* loop_ = nullptr;
    uv_idle_t idle_;
    bool idling_ = false;
    size_t steps_per_tick_;
    uint64_t ticks_ = 0;

    Evaluator* engine_ = nullptr;
    std::exception_ptr error_;

    std::map<uint64_t, Timer*> timers_;
    uint64_t next_timer_id_ = 1;

    static void on_idle(uv_idle_t* handle);
    static void on_timer(uv_timer_t* handle);

    uint64_t start_timer(double ms, bool resumes_sleeper, FunctionPtr fn, std::vector<Value> args);
    void cancel_timer(uint64_t id);
    void cancel_all_timers();
    void update_idle();
    void fail(std::exception_ptr error);
};

#endif  // SANDSTEP_HOST_LOOP_HPP
