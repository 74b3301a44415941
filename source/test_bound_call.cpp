#include <gtest/gtest.h>
#include "bound_call.h"

#include <functional>
#include <string>

TEST(boundCallTest, general)
{
    const int expectedNumber{10};
    // Some non-copyable type is needed
    auto pNumber = std::make_unique<int>(expectedNumber);
    int actualNumber{0};

    auto method = [](std::unique_ptr<int>&& input, int& output) { output = *input; };

    auto boundMethod = bind_call(std::move(method), std::move(pNumber), std::ref(actualNumber));
    (*boundMethod)();

    ASSERT_EQ(expectedNumber, actualNumber);
}

TEST(boundCallTest, argumentsAreStoredByValue)
{
    std::string text{"first"};
    std::string result;

    auto boundMethod = bind_call([&result](const std::string& input) { result = input; }, text);
    text = "second";
    (*boundMethod)();

    ASSERT_EQ("first", result);
}

namespace
{
    void increment(int& value)
    {
        ++value;
    }
}

TEST(boundCallTest, freeFunction)
{
    int value{1};

    auto boundMethod = bind_call(&increment, std::ref(value));
    (*boundMethod)();

    ASSERT_EQ(2, value);
}
