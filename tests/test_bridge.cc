#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "SandstepError.hpp"
#include "bridge.hpp"
#include "conversions.hpp"
#include "evaluator.hpp"
#include "object_model.hpp"

using Lines = std::vector<std::string>;

// Runs `source` with `alert` plus whatever `extra` installs; returns the alerts.
static Lines runWith(const std::string& source, Evaluator::Bootstrap extra) {
    Lines out;
    Evaluator engine(source, [&out, extra](Evaluator& e, const ObjectPtr& global) {
        e.register_native(global, "alert", [&out](NativeCall& call) -> Value {
            out.push_back(to_display_string(call.arg(0)));
            return Value{};
        }, 1);
        extra(e, global);
    });
    engine.run();
    return out;
}

// ============================================================================
// REGISTRATION
// ============================================================================

TEST(BridgeTest, RegisteredNativesAreHiddenFromEnumeration) {
    auto out = runWith(R"(
        var keys = [];
        for (var k in this) keys.push(k);
        alert(keys.indexOf('hostFn'));
        alert(typeof hostFn);
        alert(hostFn.name + '/' + hostFn.length);
    )", [](Evaluator& e, const ObjectPtr& global) {
        e.register_native(global, "hostFn", [](NativeCall&) -> Value { return Value{}; }, 3);
    });
    EXPECT_EQ(out, Lines({"-1", "function", "hostFn/3"}));
}

TEST(BridgeTest, RegisterNativeNeedsTarget) {
    Evaluator engine("");
    try {
        engine.register_native(nullptr, "orphan", [](NativeCall&) -> Value { return Value{}; });
        FAIL() << "expected HostMisuse";
    } catch (const SandstepError& e) {
        EXPECT_EQ(e.type(), "HostMisuse");
    }
}

TEST(BridgeTest, NativesOnHostObjects) {
    auto out = runWith(R"(
        alert(host.version);
        alert(host.describe('x'));
    )", [](Evaluator& e, const ObjectPtr& global) {
        ObjectPtr host = e.create_object();
        e.set_property(host, "version", std::string("1.2"));
        e.register_native(host, "describe", [](NativeCall& call) -> Value {
            auto self = as_object(call.this_value());
            auto version = call.engine().get_property(self, "version");
            return to_display_string(call.arg(0)) + "@" + to_display_string(*version);
        }, 1);
        e.set_property(global, "host", host);
    });
    EXPECT_EQ(out, Lines({"1.2", "x@1.2"}));
}

TEST(BridgeTest, NativesReceiveTypedValues) {
    std::vector<std::string> kinds;
    runWith("inspect(1, 'two', true, null, undefined, [3], {});", [&kinds](Evaluator& e, const ObjectPtr& global) {
        e.register_native(global, "inspect", [&kinds](NativeCall& call) -> Value {
            for (const auto& v : call.args()) kinds.push_back(type_of(v));
            return Value{};
        }, 0);
    });
    EXPECT_EQ(kinds, std::vector<std::string>({"number", "string", "boolean", "object", "undefined", "object", "object"}));
}

TEST(BridgeTest, ArrayMarshalling) {
    std::vector<Value> seen;
    auto out = runWith(R"(
        collect([1, 'a', , 4]);
        var made = build();
        alert(made.length + ':' + made.join('|'));
        alert(Array.isArray(made));
    )", [&seen](Evaluator& e, const ObjectPtr& global) {
        e.register_native(global, "collect", [&seen](NativeCall& call) -> Value {
            seen = array_to_vector(call.arg(0));
            return Value{};
        }, 1);
        e.register_native(global, "build", [](NativeCall& call) -> Value {
            return call.create_array({1.0, std::string("b"), true});
        }, 0);
    });

    ASSERT_EQ(seen.size(), 4u);
    EXPECT_DOUBLE_EQ(std::get<double>(seen[0]), 1.0);
    EXPECT_EQ(std::get<std::string>(seen[1]), "a");
    EXPECT_TRUE(is_undefined(seen[2]));
    EXPECT_EQ(out, Lines({"3:1|b|true", "true"}));
}

TEST(BridgeTest, ArrayLikeObjectsConvert) {
    Evaluator engine("");
    ObjectPtr like = engine.create_object();
    engine.set_property(like, "length", 2.0);
    engine.set_property(like, "0", std::string("first"));

    auto values = array_to_vector(like);
    ASSERT_EQ(values.size(), 2u);
    EXPECT_EQ(std::get<std::string>(values[0]), "first");
    EXPECT_TRUE(is_undefined(values[1]));
    EXPECT_TRUE(array_to_vector(5.0).empty());
}

TEST(BridgeTest, ConstructibleNative) {
    auto out = runWith(R"(
        var p = new Point(2, 3);
        alert(p.x + p.y);
        alert(p instanceof Point);
        alert(Point(1, 1));
    )", [](Evaluator& e, const ObjectPtr& global) {
        FunctionPtr point = e.create_native_function("Point", [](NativeCall& call) -> Value {
            if (!call.is_construct()) return std::string("called");
            auto self = as_object(call.this_value());
            call.engine().set_property(self, "x", call.arg(0));
            call.engine().set_property(self, "y", call.arg(1));
            return Value{};
        }, 2, true);
        ObjectPtr proto = e.create_object();
        define_property(point, "prototype", proto, true, false, false);
        e.set_property(global, "Point", point);
    });
    EXPECT_EQ(out, Lines({"5", "true", "called"}));
}

TEST(BridgeTest, NonConstructibleNativeRejectsNew) {
    Evaluator engine("new plain();", [](Evaluator& e, const ObjectPtr& global) {
        e.register_native(global, "plain", [](NativeCall&) -> Value { return Value{}; });
    });
    EXPECT_THROW(engine.run(), UncaughtGuestError);
    EXPECT_EQ(engine.failure()->description, "TypeError: plain is not a constructor");
}

// ============================================================================
// ERRORS CROSSING THE BRIDGE
// ============================================================================

TEST(BridgeTest, NativeThrowErrorIsCatchable) {
    auto out = runWith(R"(
        try {
          strict(-1);
        } catch (e) {
          alert(e instanceof RangeError);
          alert(e.message);
        }
    )", [](Evaluator& e, const ObjectPtr& global) {
        e.register_native(global, "strict", [](NativeCall& call) -> Value {
            if (to_number(call.arg(0)) < 0) call.throw_error("RangeError", "negative input");
            return Value{};
        }, 1);
    });
    EXPECT_EQ(out, Lines({"true", "negative input"}));
}

TEST(BridgeTest, NativeCanThrowAnyValue) {
    auto out = runWith("try { raise(); } catch (e) { alert(typeof e + ' ' + e); }", [](Evaluator& e, const ObjectPtr& global) {
        e.register_native(global, "raise", [](NativeCall&) -> Value {
            throw GuestException(std::string("plain string"));
        });
    });
    EXPECT_EQ(out, Lines({"string plain string"}));
}

TEST(BridgeTest, HostExceptionsBecomeGuestErrors) {
    auto out = runWith(R"(
        try {
          fragile();
        } catch (e) {
          alert(e instanceof Error);
          alert(e.message);
        }
    )", [](Evaluator& e, const ObjectPtr& global) {
        e.register_native(global, "fragile", [](NativeCall&) -> Value {
            throw std::runtime_error("disk on fire");
        });
    });
    EXPECT_EQ(out, Lines({"true", "disk on fire"}));
}

TEST(BridgeTest, GuestExceptionWhatIsDisplayString) {
    Evaluator engine("");
    GuestException e(engine.create_error("TypeError", "nope"));
    EXPECT_STREQ(e.what(), "TypeError: nope");
    EXPECT_TRUE(is_object(e.value()));
}

// ============================================================================
// CALLING BACK INTO GUEST CODE
// ============================================================================

TEST(BridgeTest, CallbackReceivesThisAndArguments) {
    auto out = runWith(R"(
        var target = {label: 'T'};
        alert(invoke(function (a, b) { return this.label + a + b; }, target));
    )", [](Evaluator& e, const ObjectPtr& global) {
        e.register_native(global, "invoke", [](NativeCall& call) -> Value {
            return call.call(call.arg(0), call.arg(1), {1.0, 2.0});
        }, 2);
    });
    EXPECT_EQ(out, Lines({"T12"}));
}

TEST(BridgeTest, CallbackThrowSurfacesAsGuestException) {
    std::string caught;
    auto out = runWith(R"(
        var r = guard(function () { throw new TypeError('inner'); });
        alert(r);
    )", [&caught](Evaluator& e, const ObjectPtr& global) {
        e.register_native(global, "guard", [&caught](NativeCall& call) -> Value {
            try {
                call.call(call.arg(0), Value{}, {});
            } catch (const GuestException& ex) {
                caught = ex.what();
                return std::string("recovered");
            }
            return std::string("no throw");
        }, 1);
    });
    EXPECT_EQ(caught, "TypeError: inner");
    EXPECT_EQ(out, Lines({"recovered"}));
}

TEST(BridgeTest, UnhandledCallbackThrowPropagatesToGuest) {
    auto out = runWith(R"(
        try {
          forward(function () { throw 'deep'; });
        } catch (e) {
          alert('caught ' + e);
        }
        alert('after');
    )", [](Evaluator& e, const ObjectPtr& global) {
        e.register_native(global, "forward", [](NativeCall& call) -> Value {
            return call.call(call.arg(0), Value{}, {});
        }, 1);
    });
    EXPECT_EQ(out, Lines({"caught deep", "after"}));
}

TEST(BridgeTest, CallingNonFunctionFromNative) {
    auto out = runWith("try { forward(42); } catch (e) { alert(e.message); }", [](Evaluator& e, const ObjectPtr& global) {
        e.register_native(global, "forward", [](NativeCall& call) -> Value {
            return call.call(call.arg(0), Value{}, {});
        }, 1);
    });
    EXPECT_EQ(out, Lines({"42 is not a function"}));
}

TEST(BridgeTest, NestedCallbacksThroughNatives) {
    auto out = runWith(R"(
        var depth = twice(function (x) {
          return twice(function (y) { return y + 1; }, x) * 10;
        }, 1);
        alert(depth);
    )", [](Evaluator& e, const ObjectPtr& global) {
        // twice(f, v) = f(f(v))
        e.register_native(global, "twice", [](NativeCall& call) -> Value {
            Value once = call.call(call.arg(0), Value{}, {call.arg(1)});
            return call.call(call.arg(0), Value{}, {once});
        }, 2);
    });
    // inner: twice(+1, x) = x + 2; outer applies (x + 2) * 10 twice
    EXPECT_EQ(out, Lines({"320"}));
}

TEST(BridgeTest, HostCallsGuestFunctionDirectly) {
    Evaluator engine("function add(a, b) { return a + b; }\nfunction fail() { throw new Error('x'); }");
    engine.run();

    Value add = *engine.get_property(engine.global_object(), "add");
    Value sum = engine.call_function(add, Value{}, {2.0, 3.0}, Token());
    EXPECT_DOUBLE_EQ(std::get<double>(sum), 5.0);

    Value fail = *engine.get_property(engine.global_object(), "fail");
    EXPECT_THROW(engine.call_function(fail, Value{}, {}, Token()), GuestException);
    EXPECT_EQ(engine.status(), EngineStatus::Completed);
    EXPECT_EQ(engine.stack_depth(), 0u);
}

TEST(BridgeTest, CallFunctionRejectedWhileResumePending) {
    Evaluator engine("function id(v) { return v; }\nwait();", [](Evaluator& e, const ObjectPtr& global) {
        e.register_native(global, "wait", [](NativeCall& call) -> Value {
            call.suspend();
            return Value{};
        });
    });
    ASSERT_TRUE(engine.run());
    Value id = *engine.get_property(engine.global_object(), "id");

    // allowed while simply waiting
    EXPECT_DOUBLE_EQ(std::get<double>(engine.call_function(id, Value{}, {7.0}, Token())), 7.0);

    engine.resume(1.0);
    try {
        engine.call_function(id, Value{}, {7.0}, Token());
        FAIL() << "expected HostMisuse";
    } catch (const SandstepError& e) {
        EXPECT_EQ(e.type(), "HostMisuse");
    }
    EXPECT_FALSE(engine.run());
}

// ============================================================================
// TAIL CALLS
// ============================================================================

TEST(BridgeTest, TailCallRunsOnEngineStack) {
    std::vector<size_t> nested_depths;
    auto out = runWith(R"(
        function work(n) { return measure() + n; }
        alert(delegate(work, 5));
    )", [&nested_depths](Evaluator& e, const ObjectPtr& global) {
        e.register_native(global, "delegate", [](NativeCall& call) -> Value {
            call.tail_call(as_function(call.arg(0)), Value{}, {call.arg(1)});
            return std::string("ignored");
        }, 2);
        e.register_native(global, "measure", [&nested_depths](NativeCall& call) -> Value {
            nested_depths.push_back(call.engine().call_depth());
            return 10.0;
        });
    });
    EXPECT_EQ(out, Lines({"15"}));
    EXPECT_EQ(nested_depths, std::vector<size_t>({1}));
}

TEST(BridgeTest, SuspendingThroughCallAndApply) {
    // call/apply hand off to the target, so a suspending target still works
    Lines out;
    Evaluator engine(R"(
        alert(wait.call(null, 'a'));
        alert(wait.apply(null, ['b']));
    )", [&out](Evaluator& e, const ObjectPtr& global) {
        e.register_native(global, "alert", [&out](NativeCall& call) -> Value {
            out.push_back(to_display_string(call.arg(0)));
            return Value{};
        }, 1);
        e.register_native(global, "wait", [](NativeCall& call) -> Value {
            call.suspend();
            return Value{};
        });
    });

    ASSERT_TRUE(engine.run());
    engine.resume(std::string("first"));
    ASSERT_TRUE(engine.run());
    engine.resume(std::string("second"));
    EXPECT_FALSE(engine.run());
    EXPECT_EQ(out, Lines({"first", "second"}));
}

TEST(BridgeTest, BoundFunctionsKeepThisAndArguments) {
    auto out = runWith(R"(
        function tag(prefix, v) { return prefix + this.id + v; }
        var bound = tag.bind({id: 7}, '#');
        alert(bound(':x'));
        alert(bound.call({id: 99}, ':y'));
        alert(bound.length);
        alert(viaHost(bound));
    )", [](Evaluator& e, const ObjectPtr& global) {
        e.register_native(global, "viaHost", [](NativeCall& call) -> Value {
            return call.call(call.arg(0), Value{}, {std::string(":z")});
        }, 1);
    });
    EXPECT_EQ(out, Lines({"#7:x", "#7:y", "1", "#7:z"}));
}

// ============================================================================
// PRIMORDIALS
// ============================================================================

TEST(BridgeTest, PrimordialsAreReachable) {
    Evaluator engine("");
    ObjectPtr array_proto = engine.primordial("Array.prototype");
    ASSERT_NE(array_proto, nullptr);
    EXPECT_EQ(engine.create_array()->prototype, array_proto);
    EXPECT_EQ(engine.primordial("Nope.prototype"), nullptr);

    ObjectPtr err = engine.create_error("TypeError", "m");
    EXPECT_EQ(err->prototype, engine.primordial("TypeError.prototype"));
    EXPECT_EQ(to_display_string(err), "TypeError: m");

    // unknown kinds fall back to Error
    ObjectPtr other = engine.create_error("CustomError", "m");
    EXPECT_EQ(other->prototype, engine.primordial("Error.prototype"));
}

TEST(BridgeTest, ExtendingBuiltInPrototypes) {
    auto out = runWith("alert([1, 2, 3].sum());", [](Evaluator& e, const ObjectPtr&) {
        e.register_native(e.primordial("Array.prototype"), "sum", [](NativeCall& call) -> Value {
            double total = 0;
            for (const auto& v : array_to_vector(call.this_value())) total += to_number(v);
            return total;
        });
    });
    EXPECT_EQ(out, Lines({"6"}));
}
