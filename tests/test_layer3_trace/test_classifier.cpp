// tests/test_layer3_trace/test_classifier.cpp
/**
 * @file test_classifier.cpp
 * @brief Role classification from declared parameters and the owning type.
 */
#include "ct_trace.hpp"
#include "gtest/gtest.h"

using namespace calltrace::trace;

namespace
{

CallableDescriptor make(std::string owner, std::vector<ParamSpec> params)
{
    CallableDescriptor d;
    d.name = "op";
    d.owner = std::move(owner);
    d.params = std::move(params);
    return d;
}

} // namespace

TEST(ClassifierTest, SelfFirstIsInstanceMethod)
{
    EXPECT_EQ(classify(make("Page", {param("self"), param("x")})), CallableRole::INSTANCE_METHOD);
    // Unbound callables are still instance methods when they declare self.
    EXPECT_EQ(classify(make("", {param("self")})), CallableRole::INSTANCE_METHOD);
}

TEST(ClassifierTest, ClsFirstOnATypeIsClassMethod)
{
    EXPECT_EQ(classify(make("Page", {param("cls"), param("x")})), CallableRole::CLASS_METHOD);
    EXPECT_EQ(classify(make("", {param("cls")})), CallableRole::FUNCTION);
}

TEST(ClassifierTest, OtherBoundCallablesAreStatic)
{
    EXPECT_EQ(classify(make("Page", {param("x")})), CallableRole::STATIC_METHOD);
}

TEST(ClassifierTest, NoPositionalParameterIsStatic)
{
    EXPECT_EQ(classify(make("", {})), CallableRole::STATIC_METHOD);
    EXPECT_EQ(classify(make("", {kw_only("self")})), CallableRole::STATIC_METHOD);
}

TEST(ClassifierTest, UnboundWithParametersIsFunction)
{
    EXPECT_EQ(classify(make("", {param("a"), param("b", 1)})), CallableRole::FUNCTION);
}

TEST(ClassifierTest, ReceiverRolesAndNames)
{
    EXPECT_TRUE(has_receiver_param(CallableRole::INSTANCE_METHOD));
    EXPECT_TRUE(has_receiver_param(CallableRole::CLASS_METHOD));
    EXPECT_FALSE(has_receiver_param(CallableRole::STATIC_METHOD));
    EXPECT_FALSE(has_receiver_param(CallableRole::FUNCTION));
    EXPECT_STREQ(role_name(CallableRole::CLASS_METHOD), "CLASS_METHOD");
}

TEST(CallableDescriptorTest, SignatureAndPrivacy)
{
    CallableDescriptor d = make("Page", {param("self"), param("a"), param("b", 1), kw_only("c", "x")});
    d.name = "fill";
    EXPECT_EQ(d.signature(), "fill(self, a, b=1, *, c=x)");
    EXPECT_EQ(d.positional_count(), 3u);
    EXPECT_FALSE(d.is_private());
    d.name = "_helper";
    EXPECT_TRUE(d.is_private());
}
