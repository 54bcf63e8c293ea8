//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "list_and_watch_session.hpp"

#include "device/change_notifier.hpp"
#include "svc_helpers.hpp"

#include <cetl/cetl.hpp>

#include <utility>

namespace mnicdp
{
namespace daemon
{
namespace engine
{
namespace svc
{

ListAndWatchSession::ListAndWatchSession(const SvcContext& context, Sender sender, IsClientGone is_client_gone)
    : context_{context}
    , sender_{std::move(sender)}
    , is_client_gone_{std::move(is_client_gone)}
    , state_{State::Started}
    , sent_count_{0}
{
    CETL_DEBUG_ASSERT(sender_, "");
    CETL_DEBUG_ASSERT(is_client_gone_, "");
}

ListAndWatchSession::Outcome ListAndWatchSession::run()
{
    using WaitResult = device::ChangeNotifier::WaitResult;

    // Generation is captured before the snapshot; any later change wakes the session,
    // possibly with an already sent state.
    auto seen_generation = context_.notifier.generation();
    if (!sendSnapshot())
    {
        return terminate(Outcome::SendFailed);
    }
    state_ = State::SentInitial;

    while (true)
    {
        state_ = State::Waiting;
        logger_->trace("Waiting for device change (gen={}).", seen_generation);

        switch (context_.notifier.waitForChange(seen_generation, context_.session_poll_period))
        {
        case WaitResult::Cancelled:
            return terminate(Outcome::Cancelled);

        case WaitResult::TimedOut:
            if (is_client_gone_())
            {
                return terminate(Outcome::ClientGone);
            }
            break;

        case WaitResult::Changed:
            logger_->debug("Devices updated (gen={}).", seen_generation);
            if (!sendSnapshot())
            {
                return terminate(Outcome::SendFailed);
            }
            state_ = State::SentUpdate;
            break;
        }
    }
}

bool ListAndWatchSession::sendSnapshot()
{
    const auto snapshot = context_.registry.snapshot();
    if (!sender_(snapshot))
    {
        logger_->error("ListAndWatch failed to send devices (count={}).", snapshot.size());
        return false;
    }

    ++sent_count_;
    return true;
}

ListAndWatchSession::Outcome ListAndWatchSession::terminate(const Outcome outcome)
{
    state_ = State::Terminated;
    logger_->info("ListAndWatch exit (outcome={}, sent={}).", static_cast<int>(outcome), sent_count_);
    return outcome;
}

}  // namespace svc
}  // namespace engine
}  // namespace daemon
}  // namespace mnicdp
