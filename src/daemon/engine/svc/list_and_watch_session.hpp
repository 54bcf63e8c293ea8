//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef MNICDP_DAEMON_ENGINE_SVC_LIST_AND_WATCH_SESSION_HPP_INCLUDED
#define MNICDP_DAEMON_ENGINE_SVC_LIST_AND_WATCH_SESSION_HPP_INCLUDED

#include "device/device_registry.hpp"
#include "logging.hpp"
#include "svc_helpers.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>

namespace mnicdp
{
namespace daemon
{
namespace engine
{
namespace svc
{

/// Streaming session of the `ListAndWatch` call.
///
/// The session always starts with the full snapshot of the registry, and then pushes
/// full (never differential) snapshots whenever the change notifier fires:
///
///   Started -> SentInitial -> Waiting -> SentUpdate -> Waiting -> ... -> Terminated
///
/// Transport specifics are abstracted by the `Sender` and `IsClientGone` functions.
///
class ListAndWatchSession final
{
public:
    using Snapshot     = device::DeviceRegistry::Snapshot;
    using Sender       = std::function<bool(const Snapshot& snapshot)>;
    using IsClientGone = std::function<bool()>;

    enum class State : std::uint8_t
    {
        Started,
        SentInitial,
        Waiting,
        SentUpdate,
        Terminated,

    };  // State

    enum class Outcome : std::uint8_t
    {
        Cancelled,   // The process is shutting down.
        ClientGone,  // The peer has cancelled the call.
        SendFailed,

    };  // Outcome

    ListAndWatchSession(const SvcContext& context, Sender sender, IsClientGone is_client_gone);

    ListAndWatchSession(const ListAndWatchSession&)                = delete;
    ListAndWatchSession(ListAndWatchSession&&) noexcept            = delete;
    ListAndWatchSession& operator=(const ListAndWatchSession&)     = delete;
    ListAndWatchSession& operator=(ListAndWatchSession&&) noexcept = delete;

    ~ListAndWatchSession() = default;

    /// Runs the session until it is terminated. Blocks the calling thread.
    ///
    Outcome run();

    State state() const noexcept
    {
        return state_;
    }

    std::size_t sentCount() const noexcept
    {
        return sent_count_;
    }

private:
    bool    sendSnapshot();
    Outcome terminate(const Outcome outcome);

    common::LoggerPtr logger_{common::getLogger("plugin")};
    const SvcContext& context_;
    Sender            sender_;
    IsClientGone      is_client_gone_;
    State             state_;
    std::size_t       sent_count_;

};  // ListAndWatchSession

}  // namespace svc
}  // namespace engine
}  // namespace daemon
}  // namespace mnicdp

#endif  // MNICDP_DAEMON_ENGINE_SVC_LIST_AND_WATCH_SESSION_HPP_INCLUDED
