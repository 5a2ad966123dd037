#include "BLEFuture.h"

#include <vector>

#include "catch2/catch.hpp"

namespace Tether { namespace BLE {

TEST_CASE("promise completes exactly once", "[unit]") {
    Promise<int> promise;
    Future<int> future = promise.future();

    std::vector<int> values;
    std::vector<Error> errors;
    future.onSuccess([&](const int& value) { values.push_back(value); });
    future.onFailure([&](const Error& error) { errors.push_back(error); });

    SECTION("success is delivered once") {
        CHECK(promise.success(7));
        CHECK_FALSE(promise.success(8));
        CHECK_FALSE(promise.failure(Error(ErrorCode::NOT_CONNECTED)));

        REQUIRE(values.size() == 1);
        CHECK(values[0] == 7);
        CHECK(errors.empty());
        CHECK(future.succeeded());
        CHECK(future.value() == 7);
    }

    SECTION("failure is delivered once") {
        CHECK(promise.failure(Error(ErrorCode::TRANSPORT, 133)));
        CHECK_FALSE(promise.success(1));

        REQUIRE(errors.size() == 1);
        CHECK(errors[0].code == ErrorCode::TRANSPORT);
        CHECK(errors[0].status == 133);
        CHECK(future.failed());
    }

    SECTION("late listeners see the result immediately") {
        promise.success(3);

        int late = 0;
        future.onSuccess([&](const int& value) { late = value; });
        CHECK(late == 3);
    }
}

TEST_CASE("stream promise delivers many times and replays history", "[unit]") {
    SECTION("unbounded history replays everything") {
        StreamPromise<int> promise;
        promise.success(1);
        promise.failure(Error(ErrorCode::NOT_CONNECTED));
        promise.success(2);

        std::vector<int> values;
        std::vector<Error> errors;
        FutureStream<int> stream = promise.stream();
        stream.onSuccess([&](const int& value) { values.push_back(value); });
        stream.onFailure([&](const Error& error) { errors.push_back(error); });

        REQUIRE(values.size() == 2);
        CHECK(values[0] == 1);
        CHECK(values[1] == 2);
        REQUIRE(errors.size() == 1);
        CHECK(errors[0] == Error(ErrorCode::NOT_CONNECTED));

        promise.success(3);
        CHECK(values.size() == 3);
        CHECK(stream.count() == 4);
    }

    SECTION("capacity bounds the history") {
        StreamPromise<int> promise(2);
        promise.success(1);
        promise.success(2);
        promise.success(3);

        std::vector<int> values;
        promise.stream().onSuccess([&](const int& value) { values.push_back(value); });

        REQUIRE(values.size() == 2);
        CHECK(values[0] == 2);
        CHECK(values[1] == 3);
    }

    SECTION("handles outlive a replaced producer") {
        StreamPromise<int> promise;
        FutureStream<int> first = promise.stream();
        promise = StreamPromise<int>();

        int delivered = 0;
        first.onSuccess([&](const int&) { delivered++; });
        promise.success(1);

        CHECK(delivered == 0);
        CHECK_FALSE(first.sameStream(promise.stream()));
    }
}

}} // namespace Tether::BLE
