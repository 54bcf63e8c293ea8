//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef MNICDP_DAEMON_ENGINE_KUBELET_REGISTRATION_CLIENT_HPP_INCLUDED
#define MNICDP_DAEMON_ENGINE_KUBELET_REGISTRATION_CLIENT_HPP_INCLUDED

#include "deviceplugin/v1beta1/api.pb.h"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <chrono>
#include <string>

namespace mnicdp
{
namespace daemon
{
namespace engine
{
namespace kubelet
{

/// Version of the device plugin API this daemon implements.
constexpr auto ApiVersion = "v1beta1";

/// Performs the one-shot registration handshake with the kubelet.
///
class RegistrationClient final
{
public:
    /// Makes registration request for the plugin listening on the given socket.
    ///
    /// The endpoint is the basename of the plugin socket path (relative to the kubelet's device plugins dir).
    ///
    static v1beta1::RegisterRequest makeRequest(const std::string& plugin_socket_path,
                                                const std::string& resource_name);

    /// Dials the kubelet registration socket, and calls `Registration.Register`.
    ///
    /// @return Failure description, or `nullopt` on success.
    ///
    CETL_NODISCARD static cetl::optional<std::string> registerPlugin(const std::string&              kubelet_socket_path,
                                                                     const v1beta1::RegisterRequest& request,
                                                                     const std::chrono::milliseconds timeout);

    RegistrationClient() = delete;

};  // RegistrationClient

}  // namespace kubelet
}  // namespace engine
}  // namespace daemon
}  // namespace mnicdp

#endif  // MNICDP_DAEMON_ENGINE_KUBELET_REGISTRATION_CLIENT_HPP_INCLUDED
