//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "engine.hpp"

#include "daemon/engine/config_fake.hpp"
#include "daemon/engine/kubelet/fake_kubelet.hpp"
#include "engine_helpers.hpp"
#include "svc/device_plugin_service.hpp"
#include "tmp_dir.hpp"

#include "deviceplugin/v1beta1/api.grpc.pb.h"
#include "deviceplugin/v1beta1/api.pb.h"

#include <grpcpp/grpcpp.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <sys/stat.h>

namespace
{

using namespace mnicdp::daemon::engine;  // NOLINT This our main concern here in the unit tests.

using testing::SizeIs;
using testing::NotNull;
using testing::HasSubstr;

// https://github.com/llvm/llvm-project/issues/53444
// NOLINTBEGIN(misc-unused-using-decls, misc-include-cleaner)
using std::literals::chrono_literals::operator""s;
using std::literals::chrono_literals::operator""ms;
// NOLINTEND(misc-unused-using-decls, misc-include-cleaner)

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

/// Clears the run flag on scope exit.
///
struct StopOnExit final
{
    std::atomic<bool>& running;

    ~StopOnExit()
    {
        running = false;
    }

};  // StopOnExit

class TestEngine : public testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_FALSE(tmp_dir_.path().empty());
        ASSERT_THAT(::mkdir(tmp_dir_.file("devices").c_str(), 0755), 0);
        ASSERT_THAT(::mkdir(tmp_dir_.file("plugins").c_str(), 0755), 0);

        config_->devices_dir       = tmp_dir_.file("devices");
        config_->plugin_dir        = tmp_dir_.file("plugins");
        config_->endpoint          = "mnicdp.sock";
        config_->kubelet_socket    = "kubelet.sock";
        config_->total_devices     = 5;
        config_->dial_timeout      = 2s;
        config_->watch_poll_period = 20ms;
    }

    static std::size_t countUnhealthy(const v1beta1::ListAndWatchResponse& response)
    {
        std::size_t count = 0;
        for (const auto& pb_device : response.devices())
        {
            count += (pb_device.health() == svc::DevicePluginService::UnhealthyStr) ? 1 : 0;
        }
        return count;
    }

    // NOLINTBEGIN
    mnicdp::TmpDir                    tmp_dir_;
    const std::shared_ptr<ConfigFake> config_{std::make_shared<ConfigFake>()};
    // NOLINTEND
};

// MARK: - Tests:

TEST_F(TestEngine, init_fails_on_missing_devices_dir)
{
    config_->devices_dir = tmp_dir_.file("missing");

    Engine     engine{config_};
    const auto failure = engine.init();
    ASSERT_TRUE(failure);
    EXPECT_THAT(failure.value(), HasSubstr("missing"));
}

TEST_F(TestEngine, init_fails_on_zero_devices)
{
    config_->total_devices = 0;

    Engine engine{config_};
    EXPECT_TRUE(engine.init());
}

TEST_F(TestEngine, registration_failure_is_not_fatal)
{
    config_->dial_timeout = 200ms;

    Engine engine{config_};
    ASSERT_FALSE(engine.init());

    // No kubelet is listening.
    EXPECT_TRUE(engine.registerWithKubelet());

    // The plugin is still served.
    EXPECT_THAT(dialUnixSocket(config_->getPluginSocketPath(), 1s), NotNull());
}

TEST_F(TestEngine, serves_device_changes)
{
    ASSERT_TRUE(tmp_dir_.touch("devices/net1"));
    ASSERT_TRUE(tmp_dir_.touch("devices/net2"));

    kubelet::FakeKubelet kubelet;
    ASSERT_TRUE(kubelet.start(config_->getKubeletSocketPath()));

    Engine engine{config_};
    {
        const auto failure = engine.init();
        ASSERT_FALSE(failure) << failure.value_or("");
    }
    {
        const auto failure = engine.registerWithKubelet();
        ASSERT_FALSE(failure) << failure.value_or("");
    }
    const auto requests = kubelet.requests();
    ASSERT_THAT(requests, SizeIs(1));
    EXPECT_THAT(requests[0].endpoint(), "mnicdp.sock");
    EXPECT_THAT(requests[0].resource_name(), config_->resource_name);

    std::atomic<bool> running{true};
    auto              run_result = std::async(std::launch::async, [&engine, &running] {
        //
        return engine.runWhile([&running] { return running.load(); });
    });
    // Stops the run loop before `run_result` is joined, also when an assertion below returns early.
    const StopOnExit stop_on_exit{running};

    const auto channel = dialUnixSocket(config_->getPluginSocketPath(), 2s);
    ASSERT_THAT(channel, NotNull());
    const auto          stub = v1beta1::DevicePlugin::NewStub(channel);
    grpc::ClientContext context;
    context.set_deadline(std::chrono::system_clock::now() + 10s);
    auto reader = stub->ListAndWatch(&context, v1beta1::Empty{});

    v1beta1::ListAndWatchResponse response;
    ASSERT_TRUE(reader->Read(&response));
    EXPECT_THAT(response.devices(), SizeIs(5));
    EXPECT_THAT(countUnhealthy(response), 2);

    ASSERT_TRUE(tmp_dir_.touch("devices/net3"));
    ASSERT_TRUE(reader->Read(&response));
    EXPECT_THAT(countUnhealthy(response), 3);

    ASSERT_TRUE(tmp_dir_.remove("devices/net1"));
    ASSERT_TRUE(reader->Read(&response));
    EXPECT_THAT(countUnhealthy(response), 2);

    running = false;
    ASSERT_THAT(run_result.wait_for(5s), std::future_status::ready);
    EXPECT_FALSE(run_result.get());

    // The run loop has shut the engine down.
    EXPECT_FALSE(reader->Read(&response));
    EXPECT_TRUE(reader->Finish().ok());
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
