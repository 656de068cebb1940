// tests/test_layer3_trace/test_call_tracer.cpp
/**
 * @file test_call_tracer.cpp
 * @brief trace(): title resolution, step reporting, frames and pass-through semantics.
 *
 * Log output of these in-process calls goes to the suite's shared log directory;
 * the exact log lines are checked by the worker scenarios in test_instrumentor.cpp.
 */
#include <memory>
#include <optional>
#include <stdexcept>

#include "ct_trace.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

using namespace calltrace::trace;
using calltrace::basics::CallFrameGuard;
using ::testing::_;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::Not;
using ::testing::Pair;

namespace
{

struct Calculator
{
    int offset = 0;
};

class MockStepReporter : public StepReporter
{
  public:
    MOCK_METHOD(std::unique_ptr<StepContext>, open_step,
                (const std::string &title, const StepParams &params), (override));
};

/// Step context that records whether it has been closed.
class FlagContext : public StepContext
{
  public:
    explicit FlagContext(std::shared_ptr<bool> closed) : closed_(std::move(closed)) {}
    ~FlagContext() override { *closed_ = true; }

  private:
    std::shared_ptr<bool> closed_;
};

CallableDescriptor add_descriptor()
{
    CallableDescriptor d;
    d.name = "add";
    d.owner = "Calculator";
    d.params = {param("self"), param("a"), param("b", 1)};
    d.doc = "Adds {{a}} and {{b}}\n:param a: left operand";
    return d;
}

class CallTracerTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        reporter_ = std::make_shared<::testing::StrictMock<MockStepReporter>>();
    }
    void TearDown() override { install_step_reporter(nullptr); }

    std::shared_ptr<::testing::StrictMock<MockStepReporter>> reporter_;
    Calculator calc_;
};

} // namespace

TEST_F(CallTracerTest, ResolveDropsReceiverFromTitleAndBindings)
{
    const ArgList args{Value::borrow(calc_, "Calculator"), Value(2), Value(3)};
    const auto rc = resolve_call(add_descriptor(), args, {});

    EXPECT_EQ(rc.role, CallableRole::INSTANCE_METHOD);
    EXPECT_EQ(rc.title, "Adds 2 and 3");
    EXPECT_EQ(rc.args.size(), 2u);
    ASSERT_EQ(rc.declared.size(), 2u);
    EXPECT_EQ(rc.declared.front().name, "a");
    EXPECT_EQ(rc.bound.count("self"), 0u);
}

TEST_F(CallTracerTest, ReceiverNeverAppearsInTitle)
{
    auto d = add_descriptor();
    d.doc = "{{self}} gets {{a}}";
    const auto rc = resolve_call(d, {Value::borrow(calc_, "Calculator"), Value(5)}, {});
    EXPECT_THAT(rc.title, Not(HasSubstr("object at")));
    EXPECT_THAT(rc.title, HasSubstr("gets 5"));
}

TEST_F(CallTracerTest, InstanceMethodCalledWithoutObjectKeepsFirstArgument)
{
    const auto rc = resolve_call(add_descriptor(), {Value(7), Value(8)}, {});
    EXPECT_EQ(rc.title, "Adds 7 and 8");
}

TEST_F(CallTracerTest, OriginalArgumentsAndResultPassThrough)
{
    size_t seen_args = 0;
    Handler traced = trace(add_descriptor(),
                           [&](const ArgList &args, const KwArgs &) -> Value
                           {
                               seen_args = args.size();
                               return Value(args[1].get<int>() + args[2].get<int>());
                           });

    const Value result = traced({Value::borrow(calc_, "Calculator"), Value(2), Value(3)}, {});
    EXPECT_EQ(seen_args, 3u);
    EXPECT_EQ(result.get<int>(), 5);
}

TEST_F(CallTracerTest, StepOpensWithTitleAndParamsAndClosesAfterReturn)
{
    install_step_reporter(reporter_);
    auto closed = std::make_shared<bool>(false);
    EXPECT_CALL(*reporter_, open_step("Adds 2 and 1",
                                      ElementsAre(Pair("a", "2"), Pair("b", "1"))))
        .WillOnce([closed](const std::string &, const StepParams &) -> std::unique_ptr<StepContext>
                  { return std::make_unique<FlagContext>(closed); });

    bool closed_during_call = true;
    Handler traced = trace(add_descriptor(),
                           [&](const ArgList &, const KwArgs &) -> Value
                           {
                               closed_during_call = *closed;
                               return {};
                           });
    traced({Value::borrow(calc_, "Calculator"), Value(2)}, {});

    EXPECT_FALSE(closed_during_call);
    EXPECT_TRUE(*closed);
}

TEST_F(CallTracerTest, FailurePropagatesUnchangedAndClosesStep)
{
    install_step_reporter(reporter_);
    auto closed = std::make_shared<bool>(false);
    EXPECT_CALL(*reporter_, open_step("Adds 1 and 1", _))
        .WillOnce([closed](const std::string &, const StepParams &) -> std::unique_ptr<StepContext>
                  { return std::make_unique<FlagContext>(closed); });

    Handler traced = trace(add_descriptor(), [](const ArgList &, const KwArgs &) -> Value
                           { throw std::out_of_range("no such cell"); });

    try
    {
        traced({Value::borrow(calc_, "Calculator"), Value(1)}, {});
        FAIL() << "expected std::out_of_range";
    }
    catch (const std::out_of_range &e)
    {
        EXPECT_STREQ(e.what(), "no such cell");
    }
    EXPECT_TRUE(*closed);
}

TEST_F(CallTracerTest, FrameIsPushedForTheCall)
{
    std::optional<std::string_view> top_during_call;
    const size_t depth_before = CallFrameGuard::depth();
    Handler traced = trace(add_descriptor(),
                           [&](const ArgList &, const KwArgs &) -> Value
                           {
                               top_during_call = CallFrameGuard::top();
                               return {};
                           });
    traced({Value::borrow(calc_, "Calculator"), Value(1)}, {});

    EXPECT_EQ(top_during_call, std::optional<std::string_view>("add"));
    EXPECT_EQ(CallFrameGuard::depth(), depth_before);
}

TEST_F(CallTracerTest, PrivateCallablesAreNotTraced)
{
    install_step_reporter(reporter_);
    EXPECT_CALL(*reporter_, open_step(_, _)).Times(0);

    auto d = add_descriptor();
    d.name = "_recalc";
    bool called = false;
    std::optional<std::string_view> top_during_call;
    Handler traced = trace(d,
                           [&](const ArgList &, const KwArgs &) -> Value
                           {
                               called = true;
                               top_during_call = CallFrameGuard::top();
                               return {};
                           });
    traced({Value::borrow(calc_, "Calculator")}, {});
    EXPECT_TRUE(called);
    EXPECT_NE(top_during_call, std::optional<std::string_view>("_recalc"));
}

TEST_F(CallTracerTest, ConstructorOpensNoStep)
{
    install_step_reporter(reporter_);
    EXPECT_CALL(*reporter_, open_step(_, _)).Times(0);

    CallableDescriptor ctor;
    ctor.name = "Calculator";
    ctor.owner = "Calculator";
    ctor.params = {param("offset", 0)};
    ctor.is_constructor = true;
    Handler traced = trace(ctor, [](const ArgList &, const KwArgs &) -> Value { return Value(1); });
    EXPECT_EQ(traced({Value(4)}, {}).get<int>(), 1);
}

TEST_F(CallTracerTest, NullReporterOpensNothing)
{
    EXPECT_FALSE(current_step_reporter()->enabled());
    Handler traced = trace(add_descriptor(), [](const ArgList &, const KwArgs &) -> Value
                           { return Value("ok"); });
    EXPECT_EQ(traced({Value::borrow(calc_, "Calculator"), Value(1)}, {}).text(), "ok");
}

TEST_F(CallTracerTest, FreeFunctionsCanBeTraced)
{
    install_step_reporter(reporter_);
    EXPECT_CALL(*reporter_, open_step("Greet Ada", ElementsAre(Pair("name", "Ada"))))
        .WillOnce([](const std::string &, const StepParams &) -> std::unique_ptr<StepContext>
                  { return nullptr; });

    CallableDescriptor d;
    d.name = "greet";
    d.params = {param("name")};
    d.doc = "Greet {{name}}";
    Handler traced = trace(d, [](const ArgList &, const KwArgs &kwargs) -> Value
                           { return Value("hi " + find_keyword(kwargs, "name")->text()); });
    EXPECT_EQ(traced({}, {{"name", Value("'Ada'")}}).text(), "hi 'Ada'");
}

TEST_F(CallTracerTest, DeepTracedRecursionReturnsNormally)
{
    CallableDescriptor d;
    d.name = "walk";
    d.params = {param("n")};
    d.doc = "Walk {{n}}";

    const int levels = static_cast<int>(calltrace::basics::kMaxCallFrameDepth) + 44;
    const size_t depth_before = CallFrameGuard::depth();
    std::optional<std::string_view> top_at_bottom = "unset";

    Handler walk;
    walk = trace(d,
                 [&](const ArgList &args, const KwArgs &) -> Value
                 {
                     const int n = args[0].get<int>();
                     if (n == 0)
                     {
                         top_at_bottom = CallFrameGuard::top();
                         return Value(0);
                     }
                     return Value(1 + walk({Value(n - 1)}, {}).get<int>());
                 });

    EXPECT_EQ(walk({Value(levels)}, {}).get<int>(), levels);
    EXPECT_EQ(top_at_bottom, std::nullopt);
    EXPECT_EQ(CallFrameGuard::depth(), depth_before);
}

TEST_F(CallTracerTest, EmptyHandlerIsRejected)
{
    EXPECT_THROW(trace(add_descriptor(), Handler{}), std::invalid_argument);
}
