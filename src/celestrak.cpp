/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <orbitcast/celestrak.hpp>
#include <curlpp/cURLpp.hpp>
#include <curlpp/Easy.hpp>
#include <curlpp/Infos.hpp>
#include <curlpp/Options.hpp>
#include <sstream>
#include <stdexcept>

#include <spdlog/spdlog.h>

using spdlog::debug;

namespace orbitcast::celestrak {

std::string groupURL(const std::string &baseURI, const std::string &group) {
    // Use "active" as default if group is empty
    std::string groupName = group.empty() ? "active" : group;

    std::ostringstream urlBuilder;
    urlBuilder << baseURI << "?GROUP=" << groupName << "&FORMAT=tle";
    return urlBuilder.str();
}

void checkResponse(const std::string &url, const std::string &body) {
    if (body.find("No GP data found") != std::string::npos) {
        throw std::runtime_error("Celestrak error: No GP data found at '" + url + "'");
    }
}

std::string fetchTLE(const std::string &url, std::chrono::seconds timeout) {
    // Initialize curlpp
    curlpp::Cleanup cleaner;
    curlpp::Easy request;

    debug("Downloading {}", url);

    // Set up the request
    request.setOpt(new curlpp::options::Url(url));
    request.setOpt(new curlpp::options::FollowLocation(true));
    request.setOpt(new curlpp::options::Timeout(static_cast<long>(timeout.count())));

    // Perform the request and capture response
    std::ostringstream responseStream;
    request.setOpt(new curlpp::options::WriteStream(&responseStream));

    long status = 0;
    try {
        request.perform();
        status = curlpp::infos::ResponseCode::get(request);
    } catch (curlpp::RuntimeError &e) {
        throw std::runtime_error(std::string("HTTP request failed: ") + e.what());
    } catch (curlpp::LogicError &e) {
        throw std::runtime_error(std::string("HTTP logic error: ") + e.what());
    }

    if (status >= 400) {
        throw std::runtime_error("HTTP request to '" + url + "' failed with status " + std::to_string(status));
    }

    std::string response = responseStream.str();
    debug("Response length: {} bytes", response.length());

    checkResponse(url, response);
    return response;
}

} // namespace orbitcast::celestrak
