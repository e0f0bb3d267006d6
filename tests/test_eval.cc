#include <gtest/gtest.h>

#include <deque>
#include <memory>
#include <string>
#include <vector>

#include "SandstepError.hpp"
#include "conversions.hpp"
#include "evaluator.hpp"
#include "object_model.hpp"

// Owns an engine whose global `alert` records what the script shows.
class ScriptRunner {
   public:
    explicit ScriptRunner(const std::string& source, Evaluator::Bootstrap extra = nullptr)
        : engine(source, [this, extra](Evaluator& e, const ObjectPtr& global) {
              e.register_native(global, "alert", [this](NativeCall& call) -> Value {
                  output.push_back(to_display_string(call.arg(0)));
                  return Value{};
              }, 1);
              if (extra) extra(e, global);
          }) {}

    std::vector<std::string> run() {
        engine.run();
        return output;
    }

    std::vector<std::string> output;
    Evaluator engine;
};

static std::vector<std::string> runScript(const std::string& source, Evaluator::Bootstrap extra = nullptr) {
    ScriptRunner runner(source, std::move(extra));
    return runner.run();
}

// Value of the last top-level expression statement.
static Value evalValue(const std::string& source) {
    Evaluator engine(source);
    engine.run();
    return engine.last_value();
}

static std::string evalString(const std::string& source) {
    return to_display_string(evalValue(source));
}

using Lines = std::vector<std::string>;

// ============================================================================
// BASIC FUNCTIONALITY
// ============================================================================

TEST(EvaluatorTest, SimpleArithmetic) {
    EXPECT_EQ(runScript("var result = 5 + 3;\nalert(result);"), Lines({"8"}));
}

TEST(EvaluatorTest, VariableAssignments) {
    EXPECT_EQ(runScript(R"(
        var x = 10;
        var y = 20;
        var sum = x + y;
        alert(sum);
    )"), Lines({"30"}));
}

TEST(EvaluatorTest, Fibonacci) {
    auto out = runScript(R"(
        var result = [];
        function fibonacci(n, output) {
          var a = 1, b = 1, sum;
          for (var i = 0; i < n; i++) {
            output.push(a);
            sum = a + b;
            a = b;
            b = sum;
          }
        }
        fibonacci(8, result);
        alert(result.join(', '));
    )");
    EXPECT_EQ(out, Lines({"1, 1, 2, 3, 5, 8, 13, 21"}));
}

TEST(EvaluatorTest, OperatorPrecedenceAndNumbers) {
    EXPECT_EQ(evalString("2 + 3 * 4"), "14");
    EXPECT_EQ(evalString("(2 + 3) * 4"), "20");
    EXPECT_EQ(evalString("7 % 3"), "1");
    EXPECT_EQ(evalString("1 / 0"), "Infinity");
    EXPECT_EQ(evalString("0.1 + 0.2"), "0.30000000000000004");
    EXPECT_EQ(evalString("0xff + 1"), "256");
}

TEST(EvaluatorTest, StringConcatenationAndCoercion) {
    EXPECT_EQ(evalString("'a' + 1 + 2"), "a12");
    EXPECT_EQ(evalString("1 + 2 + 'a'"), "3a");
    EXPECT_EQ(evalString("'5' * '2'"), "10");
    EXPECT_EQ(evalString("[1, 2] + ''"), "1,2");
    EXPECT_EQ(evalString("'n: ' + null + ' ' + undefined"), "n: null undefined");
}

TEST(EvaluatorTest, ComparisonAndEquality) {
    EXPECT_EQ(evalString("'apple' < 'banana'"), "true");
    EXPECT_EQ(evalString("'10' < '9'"), "true");
    EXPECT_EQ(evalString("'10' < 9"), "false");
    EXPECT_EQ(evalString("NaN == NaN"), "false");
    EXPECT_EQ(evalString("null == undefined"), "true");
    EXPECT_EQ(evalString("null === undefined"), "false");
    EXPECT_EQ(evalString("'1' == 1"), "true");
}

TEST(EvaluatorTest, LogicalOperatorsShortCircuit) {
    auto out = runScript(R"(
        function touch(v) { alert('touched'); return v; }
        var a = false && touch(1);
        var b = true || touch(2);
        var c = 0 || 'fallback';
        var d = 'x' && 'y';
        alert(a); alert(b); alert(c); alert(d);
    )");
    EXPECT_EQ(out, Lines({"false", "true", "fallback", "y"}));
}

TEST(EvaluatorTest, TypeofOperator) {
    auto out = runScript(R"(
        alert(typeof 1);
        alert(typeof 'x');
        alert(typeof null);
        alert(typeof undefined);
        alert(typeof function () {});
        alert(typeof {});
        alert(typeof neverDeclared);
    )");
    EXPECT_EQ(out, Lines({"number", "string", "object", "undefined", "function", "object", "undefined"}));
}

// ============================================================================
// FUNCTIONS
// ============================================================================

TEST(EvaluatorTest, FunctionDeclarationsAndCalls) {
    auto out = runScript(R"(
        function greet(name) {
          return "Hello, " + name + "!";
        }
        var message = greet("World");
        alert(message);
    )");
    EXPECT_EQ(out, Lines({"Hello, World!"}));
}

TEST(EvaluatorTest, RecursiveFunctions) {
    auto out = runScript(R"(
        function factorial(n) {
          if (n <= 1) return 1;
          return n * factorial(n - 1);
        }
        alert(factorial(5));
    )");
    EXPECT_EQ(out, Lines({"120"}));
}

TEST(EvaluatorTest, FunctionExpressions) {
    auto out = runScript(R"(
        var multiply = function(a, b) {
          return a * b;
        };
        alert(multiply(4, 7));
        alert(multiply.name);
    )");
    EXPECT_EQ(out, Lines({"28", "multiply"}));
}

TEST(EvaluatorTest, FunctionsAreHoisted) {
    auto out = runScript(R"(
        alert(early());
        alert(typeof later);
        function early() { return 'hoisted'; }
        var later = 1;
    )");
    EXPECT_EQ(out, Lines({"hoisted", "undefined"}));
}

TEST(EvaluatorTest, NamedFunctionExpressionSeesItself) {
    EXPECT_EQ(evalString("var f = function fact(n) { return n <= 1 ? 1 : n * fact(n - 1); }; f(4)"), "24");
}

TEST(EvaluatorTest, MissingArgumentsAreUndefined) {
    auto out = runScript(R"(
        function show(a, b) { alert(b); alert(arguments.length); alert(arguments[0]); }
        show('only');
    )");
    EXPECT_EQ(out, Lines({"undefined", "1", "only"}));
}

TEST(EvaluatorTest, NestedFunctionCalls) {
    auto out = runScript(R"(
        function add(a, b) { return a + b; }
        function multiply(a, b) { return a * b; }
        alert(multiply(add(2, 3), add(4, 6)));
    )");
    EXPECT_EQ(out, Lines({"50"}));
}

TEST(EvaluatorTest, Closures) {
    auto out = runScript(R"(
        function createCounter(start) {
          var count = start;
          return function() {
            count++;
            return count;
          };
        }
        var counter = createCounter(5);
        alert(counter());
        alert(counter());
        alert(counter());
    )");
    EXPECT_EQ(out, Lines({"6", "7", "8"}));
}

TEST(EvaluatorTest, LetLoopBindingsArePerIteration) {
    auto out = runScript(R"(
        var fns = [];
        for (let i = 0; i < 3; i++) {
          fns.push(function () { return i; });
        }
        alert(fns[0]() + ',' + fns[1]() + ',' + fns[2]());
    )");
    EXPECT_EQ(out, Lines({"0,1,2"}));
}

TEST(EvaluatorTest, StatePersistsAcrossCalls) {
    auto out = runScript(R"(
        var counter = 0;
        function increment() {
          counter++;
          alert(counter);
        }
        increment();
        increment();
        increment();
    )");
    EXPECT_EQ(out, Lines({"1", "2", "3"}));
}

// ============================================================================
// CONTROL FLOW
// ============================================================================

TEST(EvaluatorTest, IfElse) {
    auto out = runScript(R"(
        var x = 15;
        if (x > 10) {
          alert("greater than 10");
        } else {
          alert("less than or equal to 10");
        }
    )");
    EXPECT_EQ(out, Lines({"greater than 10"}));
}

TEST(EvaluatorTest, ForLoop) {
    auto out = runScript(R"(
        var sum = 0;
        for (var i = 1; i <= 5; i++) {
          sum += i;
        }
        alert(sum);
    )");
    EXPECT_EQ(out, Lines({"15"}));
}

TEST(EvaluatorTest, WhileLoop) {
    auto out = runScript(R"(
        var count = 0;
        var sum = 0;
        while (count < 4) {
          sum += count;
          count++;
        }
        alert(sum);
    )");
    EXPECT_EQ(out, Lines({"6"}));
}

TEST(EvaluatorTest, DoWhileRunsAtLeastOnce) {
    auto out = runScript(R"(
        var n = 10;
        do { alert(n); n++; } while (n < 3);
    )");
    EXPECT_EQ(out, Lines({"10"}));
}

TEST(EvaluatorTest, BreakAndContinue) {
    auto out = runScript(R"(
        var seen = [];
        for (var i = 0; i < 10; i++) {
          if (i % 2 === 1) continue;
          if (i > 6) break;
          seen.push(i);
        }
        alert(seen.join(' '));
    )");
    EXPECT_EQ(out, Lines({"0 2 4 6"}));
}

TEST(EvaluatorTest, LabeledBreakAndContinue) {
    auto out = runScript(R"(
        var pairs = [];
        outer: for (var i = 0; i < 3; i++) {
          for (var j = 0; j < 3; j++) {
            if (j === 1) continue outer;
            if (i === 2) break outer;
            pairs.push(i + '' + j);
          }
        }
        alert(pairs.join(','));
    )");
    EXPECT_EQ(out, Lines({"00,10"}));
}

TEST(EvaluatorTest, ForInVisitsKeysInOrder) {
    auto out = runScript(R"(
        var obj = {b: 1, a: 2};
        obj[1] = 'one';
        var keys = [];
        for (var k in obj) keys.push(k);
        alert(keys.join(','));

        var arr = ['x', 'y'];
        arr.extra = true;
        var akeys = [];
        for (var key in arr) akeys.push(key);
        alert(akeys.join(','));
    )");
    EXPECT_EQ(out, Lines({"b,a,1", "0,1,extra"}));
}

TEST(EvaluatorTest, ForInIncludesInheritedAndSkipsDeleted) {
    auto out = runScript(R"(
        var base = {inherited: 1};
        var obj = Object.create(base);
        obj.own = 1;
        obj.doomed = 1;
        var keys = [];
        for (var k in obj) {
          if (k === 'own') delete obj.doomed;
          keys.push(k);
        }
        alert(keys.join(','));
        for (var n in null) alert('never');
    )");
    EXPECT_EQ(out, Lines({"own,inherited"}));
}

TEST(EvaluatorTest, ConditionalAndSequence) {
    EXPECT_EQ(evalString("var a = 3; a > 2 ? 'big' : 'small'"), "big");
    EXPECT_EQ(evalString("var x = (1, 2, 3); x"), "3");
}

// ============================================================================
// ARRAYS AND OBJECTS
// ============================================================================

TEST(EvaluatorTest, ArrayOperations) {
    auto out = runScript(R"(
        var arr = [1, 2, 3];
        arr.push(4);
        alert(arr.length);
        alert(arr[3]);
    )");
    EXPECT_EQ(out, Lines({"4", "4"}));
}

TEST(EvaluatorTest, ObjectProperties) {
    auto out = runScript(R"(
        var person = {
          name: "John",
          age: 30
        };
        person.city = "New York";
        alert(person.name);
        alert(person.age);
        alert(person.city);
        alert(person.missing);
    )");
    EXPECT_EQ(out, Lines({"John", "30", "New York", "undefined"}));
}

TEST(EvaluatorTest, ComplexArrayManipulations) {
    auto out = runScript(R"(
        var numbers = [1, 2, 3, 4, 5];
        var doubled = [];
        var filtered = [];

        // Double each number
        for (var i = 0; i < numbers.length; i++) {
          doubled.push(numbers[i] * 2);
        }

        // Filter even numbers from doubled array
        for (var j = 0; j < doubled.length; j++) {
          if (doubled[j] % 2 === 0) {
            filtered.push(doubled[j]);
          }
        }

        alert("Original: " + numbers.join(', '));
        alert("Doubled: " + doubled.join(', '));
        alert("Even doubled: " + filtered.join(', '));
    )");
    EXPECT_EQ(out, Lines({"Original: 1, 2, 3, 4, 5", "Doubled: 2, 4, 6, 8, 10", "Even doubled: 2, 4, 6, 8, 10"}));
}

TEST(EvaluatorTest, ArrayLengthFollowsWritesAndDeletes) {
    auto out = runScript(R"(
        var a = [1, 2, 3];
        a[5] = 6;
        alert(a.length);
        delete a[5];
        alert(a.length);
        a.length = 1;
        alert(a.join('-'));
        var holes = [1, , 3, ];
        alert(holes.length);
        alert(Array(3).length);
    )");
    EXPECT_EQ(out, Lines({"6", "3", "1", "3", "3"}));
}

TEST(EvaluatorTest, ArrayBuiltins) {
    auto out = runScript(R"(
        var a = [3, 1, 2];
        alert(a.pop());
        a.unshift(0);
        alert(a.join());
        alert(a.shift());
        alert(a.slice(-1).join());
        alert(a.concat([7, 8], 9).join('|'));
        alert(a.indexOf(1));
        alert(a.reverse().join());
        alert(Array.isArray(a) + ' ' + Array.isArray({}));
    )");
    EXPECT_EQ(out, Lines({"2", "0,3,1", "0", "1", "3|1|7|8|9", "1", "1,3", "true false"}));
}

TEST(EvaluatorTest, StringBuiltins) {
    auto out = runScript(R"(
        var s = '  Hello World  ';
        var t = s.trim();
        alert(t.length);
        alert(t.toUpperCase());
        alert(t.charAt(4) + t[6]);
        alert(t.indexOf('World'));
        alert(t.slice(-5));
        alert(t.substring(5, 0));
        alert('a,b,,c'.split(',').length);
        alert(t.charCodeAt(0));
    )");
    EXPECT_EQ(out, Lines({"11", "HELLO WORLD", "oW", "6", "World", "Hello", "4", "72"}));
}

TEST(EvaluatorTest, NumberAndMathBuiltins) {
    auto out = runScript(R"(
        alert((255).toString(16));
        alert(Math.max(1, 9, 3) + Math.min(4, 2));
        alert(Math.floor(2.7) + Math.ceil(2.1) + Math.round(2.5));
        alert(parseInt('42px') + parseFloat('1.5e1'));
        alert(isNaN(parseInt('nope')));
        alert(Math.abs(-3) * Math.pow(2, 3));
        var r = Math.random();
        alert(r >= 0 && r < 1);
    )");
    EXPECT_EQ(out, Lines({"ff", "11", "8", "57", "true", "24", "true"}));
}

TEST(EvaluatorTest, PrimitiveWritesAreIgnored) {
    EXPECT_EQ(evalString("var s = 'abc'; s.foo = 1; typeof s.foo"), "undefined");
}

TEST(EvaluatorTest, UndeclaredAssignmentIsReferenceError) {
    auto out = runScript(R"(
        function leak() { leaked = 'yes'; }
        try { leak(); } catch (e) { alert(e.name + ': ' + e.message); }
        alert(typeof leaked);
        hostValue = 2;
        alert(hostValue);
    )", [](Evaluator& e, const ObjectPtr& global) {
        e.set_property(global, "hostValue", 1.0);
    });
    EXPECT_EQ(out, Lines({"ReferenceError: leaked is not defined", "undefined", "2"}));
}

TEST(EvaluatorTest, InOperatorAndDelete) {
    auto out = runScript(R"(
        var o = {a: 1};
        alert('a' in o);
        alert('toString' in o);
        alert(delete o.a);
        alert('a' in o);
        alert(o.hasOwnProperty('toString'));
    )");
    EXPECT_EQ(out, Lines({"true", "true", "true", "false", "false"}));
}

// ============================================================================
// PROTOTYPES AND CONSTRUCTORS
// ============================================================================

TEST(EvaluatorTest, ObjectOrientedPatterns) {
    auto out = runScript(R"(
        function Person(name, age) {
          this.name = name;
          this.age = age;
        }

        Person.prototype.greet = function() {
          return "Hi, I'm " + this.name + " and I'm " + this.age + " years old.";
        };

        var john = new Person("John", 25);
        alert(john.greet());
        alert(john instanceof Person);
        alert(john.constructor === Person);
    )");
    EXPECT_EQ(out, Lines({"Hi, I'm John and I'm 25 years old.", "true", "true"}));
}

TEST(EvaluatorTest, ConstructorReturningObjectWins) {
    EXPECT_EQ(evalString("function F() { this.a = 1; return {b: 2}; } var f = new F(); f.b + ':' + f.a"), "2:undefined");
    EXPECT_EQ(evalString("function G() { this.a = 1; return 5; } new G().a"), "1");
}

TEST(EvaluatorTest, PrototypeChainDelegation) {
    auto out = runScript(R"(
        var animal = {speak: function () { return this.sound; }};
        var dog = Object.create(animal);
        dog.sound = 'woof';
        alert(dog.speak());
        alert(Object.getPrototypeOf(dog) === animal);
        var bare = Object.create(null);
        alert(Object.getPrototypeOf(bare));
        dog.__proto__ = {speak: function () { return 'swapped'; }};
        alert(dog.speak());
    )");
    EXPECT_EQ(out, Lines({"woof", "true", "null", "swapped"}));
}

TEST(EvaluatorTest, CallApplyBind) {
    auto out = runScript(R"(
        function describe(greeting, punct) { return greeting + ', ' + this.name + punct; }
        var who = {name: 'Ada'};
        alert(describe.call(who, 'Hi', '!'));
        alert(describe.apply(who, ['Hello', '?']));
        var bound = describe.bind(who, 'Hey');
        alert(bound('.'));
        alert(bound.name);
    )");
    EXPECT_EQ(out, Lines({"Hi, Ada!", "Hello, Ada?", "Hey, Ada.", "bound describe"}));
}

TEST(EvaluatorTest, ObjectKeys) {
    EXPECT_EQ(evalString("Object.keys({x: 1, y: 2}).join()"), "x,y");
}

// ============================================================================
// NATIVE FUNCTIONS
// ============================================================================

TEST(EvaluatorTest, CustomNativeFunction) {
    auto out = runScript("var result = customAdd(5, 3);\nalert(result);", [](Evaluator& e, const ObjectPtr& global) {
        e.register_native(global, "customAdd", [](NativeCall& call) -> Value {
            return to_number(call.arg(0)) + to_number(call.arg(1));
        }, 2);
    });
    EXPECT_EQ(out, Lines({"8"}));
}

TEST(EvaluatorTest, NativeFunctionWithCallback) {
    auto out = runScript(R"(
        var numbers = [1, 2, 3, 4, 5];
        var doubled = mapArray(numbers, function(x) {
          return x * 2;
        });
        alert(doubled.join(', '));
    )", [](Evaluator& e, const ObjectPtr& global) {
        e.register_native(global, "mapArray", [](NativeCall& call) -> Value {
            std::vector<Value> mapped;
            std::vector<Value> input = array_to_vector(call.arg(0));
            for (size_t i = 0; i < input.size(); ++i) {
                mapped.push_back(call.call(call.arg(1), Value{}, {input[i], static_cast<double>(i)}));
            }
            return call.create_array(mapped);
        }, 2);
    });
    EXPECT_EQ(out, Lines({"2, 4, 6, 8, 10"}));
}

TEST(EvaluatorTest, MultipleNativeFunctions) {
    auto out = runScript(R"(
        var result1 = customAdd(5, 3);
        var result2 = customMultiply(4, 6);
        alert(result1);
        alert(result2);
    )", [](Evaluator& e, const ObjectPtr& global) {
        e.register_native(global, "customAdd", [](NativeCall& call) -> Value {
            return to_number(call.arg(0)) + to_number(call.arg(1));
        }, 2);
        e.register_native(global, "customMultiply", [](NativeCall& call) -> Value {
            return to_number(call.arg(0)) * to_number(call.arg(1));
        }, 2);
    });
    EXPECT_EQ(out, Lines({"8", "24"}));
}

TEST(EvaluatorTest, NativeFunctionReturningObject) {
    auto out = runScript(R"(
        var data = getData();
        alert(data.name);
        alert(data.value);
    )", [](Evaluator& e, const ObjectPtr& global) {
        e.register_native(global, "getData", [](NativeCall& call) -> Value {
            ObjectPtr obj = call.create_object();
            call.engine().set_property(obj, "name", std::string("Test"));
            call.engine().set_property(obj, "value", 42.0);
            return obj;
        }, 0);
    });
    EXPECT_EQ(out, Lines({"Test", "42"}));
}

// ============================================================================
// ERROR HANDLING
// ============================================================================

TEST(EvaluatorTest, SyntaxErrorsThrowFromConstructor) {
    EXPECT_THROW(Evaluator("var x = 5 +;"), SandstepError);
}

TEST(EvaluatorTest, PropertyWriteOnNullThrows) {
    ScriptRunner runner("var obj = null;\nobj.property = 'test';");
    EXPECT_THROW(runner.engine.run(), UncaughtGuestError);
    ASSERT_TRUE(runner.engine.failure().has_value());
    EXPECT_EQ(runner.engine.failure()->description, "TypeError: Cannot set properties of null (setting 'property')");
}

TEST(EvaluatorTest, UndefinedVariableThrows) {
    ScriptRunner runner("alert(undefinedVariable);");
    EXPECT_THROW(runner.engine.run(), UncaughtGuestError);
    EXPECT_EQ(runner.engine.failure()->description, "ReferenceError: undefinedVariable is not defined");
    EXPECT_TRUE(runner.output.empty());
}

TEST(EvaluatorTest, ConstReassignmentThrows) {
    Evaluator engine("const k = 1;\nk = 2;");
    EXPECT_THROW(engine.run(), UncaughtGuestError);
    EXPECT_EQ(engine.failure()->description, "TypeError: Assignment to constant variable.");
}

TEST(EvaluatorTest, CallingNonFunctionThrows) {
    Evaluator engine("var o = {};\no.missing();");
    EXPECT_THROW(engine.run(), UncaughtGuestError);
    EXPECT_EQ(engine.failure()->description, "TypeError: o.missing is not a function");
}

// ============================================================================
// EDGE CASES AND ISOLATION
// ============================================================================

TEST(EvaluatorTest, EmptyCode) {
    EXPECT_NO_THROW({
        auto out = runScript("");
        EXPECT_TRUE(out.empty());
    });
}

TEST(EvaluatorTest, CommentOnlyCode) {
    auto out = runScript(R"(
        // This is a comment
        /* This is also a comment */
    )");
    EXPECT_TRUE(out.empty());
}

TEST(EvaluatorTest, IndependentInterpreters) {
    std::vector<std::string> shown;
    Evaluator::Bootstrap record = [&shown](Evaluator& e, const ObjectPtr& global) {
        e.register_native(global, "alert", [&shown](NativeCall& call) -> Value {
            shown.push_back(to_display_string(call.arg(0)));
            return Value{};
        }, 1);
    };

    Evaluator first("var x = 10;\nalert(x);", record);
    Evaluator second("var x = 20;\nalert(x);", record);
    first.run();
    second.run();

    EXPECT_EQ(shown, Lines({"10", "20"}));
    EXPECT_DOUBLE_EQ(std::get<double>(*first.get_property(first.global_object(), "x")), 10.0);
    EXPECT_NE(first.global_object(), second.global_object());
}

TEST(EvaluatorTest, StandardGlobalsCanBeLeftOut) {
    EngineOptions options;
    options.install_standard_globals = false;
    Evaluator engine("typeof Math", nullptr, options);
    engine.run();
    EXPECT_EQ(to_display_string(engine.last_value()), "undefined");

    // the built-in prototypes are still there
    Evaluator methods("[1, 2].join('+')", nullptr, options);
    methods.run();
    EXPECT_EQ(to_display_string(methods.last_value()), "1+2");
}

TEST(EvaluatorTest, QueuedCallbacksRunAfterMainProgram) {
    // setTimeout stand-in: callbacks wait in a host queue until the engine is idle
    std::deque<FunctionPtr> timers;
    ScriptRunner runner(R"(
        var count = 0;
        function increment() {
          count++;
          alert(count);
          if (count < 3) {
            setTimeout(increment, 1);
          }
        }
        increment();
    )", [&timers](Evaluator& e, const ObjectPtr& global) {
        e.register_native(global, "setTimeout", [&timers](NativeCall& call) -> Value {
            timers.push_back(as_function(call.arg(0)));
            return Value{};
        }, 2);
    });

    runner.engine.run();
    while (!timers.empty()) {
        runner.engine.queue_call(timers.front());
        timers.pop_front();
        runner.engine.run();
    }

    EXPECT_EQ(runner.output, Lines({"1", "2", "3"}));
    EXPECT_EQ(runner.engine.status(), EngineStatus::Completed);
}

TEST(EvaluatorTest, DeferredCallbacksQueuedFromGuestCode) {
    auto out = runScript(R"(
        var count = 0;
        function increment() {
          count++;
          alert(count);
          if (count < 3) defer(increment);
        }
        defer(increment);
        alert('main done');
    )", [](Evaluator& e, const ObjectPtr& global) {
        e.register_native(global, "defer", [](NativeCall& call) -> Value {
            auto fn = as_function(call.arg(0));
            if (!fn) call.throw_error("TypeError", "defer needs a function");
            call.engine().queue_call(fn);
            return Value{};
        }, 1);
    });
    EXPECT_EQ(out, Lines({"main done", "1", "2", "3"}));
}

// ============================================================================
// ARRAY LENGTH AND SPARSE ARRAYS
// ============================================================================

TEST(EvaluatorTest, ArrayLengthWritesKeepHoles) {
    auto out = runScript(R"(
        var a = Array(5);
        a.length = 3;
        alert(a.length);
        var h = [1, , , ];
        alert(h.length);
        h.length = 2;
        alert(h.length);
        alert(h.join('-'));
        h.length = 4;
        alert(h.length + ' ' + h.join('-'));
        var e = [];
        e.length = 3;
        alert(e[0] + ' ' + e.length);
    )");
    EXPECT_EQ(out, Lines({"3", "3", "2", "1-", "4 1---", "undefined 3"}));
}

TEST(EvaluatorTest, SparseArraysStayCheap) {
    auto out = runScript(R"(
        var a = [];
        a[10000000] = 1;
        alert(a.length);
        alert(a.indexOf(1));
        alert(a.slice(9999999).join('|'));
        var b = a.concat([2]);
        alert(b.length + ' ' + b[10000001]);
        alert(a.reverse()[0] + ' ' + a.length);
        a.reverse();
        alert(a.indexOf(1) + ' ' + a.indexOf(undefined));
        a.shift();
        a.unshift('x');
        alert(a[0] + ' ' + a.length);
    )");
    EXPECT_EQ(out, Lines({"10000001", "10000000", "|1", "10000002 2", "1 10000001", "10000000 -1", "x 10000001"}));
}

TEST(EvaluatorTest, ContinueThroughLabelChain) {
    auto out = runScript(R"(
        outer: inner: for (var i = 0; i < 3; i++) {
          if (i === 1) continue outer;
          alert(i);
        }
        a: b: while (true) { break a; }
        alert('after');
    )");
    EXPECT_EQ(out, Lines({"0", "2", "after"}));
}

TEST(EvaluatorTest, MathRoundKeepsPrecision) {
    auto out = runScript(R"(
        alert(Math.round(0.49999999999999994));
        alert(Math.round(-2.5));
        alert(Math.round(2.5));
        alert(Math.round(-0.6));
        alert(Math.round(4503599627370497));
    )");
    EXPECT_EQ(out, Lines({"0", "-2", "3", "-1", "4503599627370497"}));
}
