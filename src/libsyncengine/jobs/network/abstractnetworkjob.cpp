/*
 * FireSync - Desktop
 * Copyright (C) 2023-2025 Infomaniak Network SA
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */
#include "abstractnetworkjob.h"
#include "libcommon/utility/utility.h"
#include "libcommonserver/log/log.h"
#include "libcommonserver/utility/utility.h"
#include "requests/parameterscache.h"

#include <log4cplus/loggingmacros.h>

#include <Poco/Error.h>
#include <Poco/JSON/Parser.h>
#include <Poco/Net/Context.h>
#include <Poco/Net/HTTPRequest.h>
#include <Poco/Net/HTTPSClientSession.h>

#include <algorithm>
#include <iterator>
#include <sstream>

namespace FSC {

namespace {
constexpr std::size_t sendBufferSize = 64 * 1024;
constexpr int maxBackoffShift = 16;

const ExitInfo canceled{ExitCode::OperationCanceled, ExitCause::OperationCanceled};

Poco::Net::Context::Ptr sslContext() {
    static const Poco::Net::Context::Ptr context = [] {
        Poco::Net::Context::Ptr ctx = new Poco::Net::Context(Poco::Net::Context::TLS_CLIENT_USE, "", "", "",
                                                             Poco::Net::Context::VERIFY_RELAXED, 9, true);
        ctx->requireMinimumProtocol(Poco::Net::Context::PROTO_TLSV1_2);
        return ctx;
    }();
    return context;
}

bool streamFailed(const std::ios &stream) {
    return (stream.fail() || stream.bad()) && !stream.eof();
}

bool worthAnotherTrial(const ExitInfo &exitInfo) {
    return exitInfo.isRecoverable();
}
} // namespace

AbstractNetworkJob::AbstractNetworkJob() {
    const Parameters &parameters = ParametersCache::instance()->parameters();
    _timeoutSec = parameters.requestTimeoutSec();
    _trials = std::max(parameters.maxRetries(), 1);
    _backoffMs = parameters.retryBackoffMs();
}

AbstractNetworkJob::~AbstractNetworkJob() {
    closeSession();
}

void AbstractNetworkJob::abort() {
    AbstractJob::abort();

    const std::scoped_lock lock(_sessionMutex);
    if (!_session) return;
    try {
        if (_session->connected()) _session->abort();
    } catch (const Poco::Exception &e) {
        LOG_DEBUG(_logger, "Job " << jobId() << " : session abort failed: " << e.displayText());
    }
}

ExitInfo AbstractNetworkJob::runJob() noexcept {
    const std::string url = getUrl();
    Poco::URI uri;
    try {
        uri = Poco::URI(url);
    } catch (const Poco::SyntaxException &e) {
        LOG_WARN(_logger, "Job " << jobId() << " : invalid URL '" << url << "' : " << e.displayText());
        return {ExitCode::LogicError, ExitCause::InvalidArgument};
    }
    if (uri.getHost().empty()) {
        LOG_WARN(_logger, "Job " << jobId() << " : no host in URL '" << url << "'");
        return {ExitCode::LogicError, ExitCause::InvalidArgument};
    }

    ExitInfo exitInfo;
    for (int trial = 1; trial <= _trials; ++trial) {
        if (trial > 1) {
            const int delayMs = _backoffMs * (1 << std::min(trial - 2, maxBackoffShift));
            LOG_DEBUG(_logger, "Job " << jobId() << " : trial " << trial << " in " << delayMs << " ms");
            Utility::msleep(delayMs);
        }
        if (isAborted()) return canceled;

        try {
            exitInfo = runTrial(uri);
        } catch (const std::exception &e) {
            exitInfo = networkFailure("Request failed", e.what());
        }

        if (exitInfo) break;
        if (isAborted()) return canceled;
        if (!worthAnotherTrial(exitInfo) || trial == _trials) {
            LOG_INFO(_logger, "Job " << jobId() << " : " << _httpMethod << " " << uri.toString() << " failed: " << exitInfo);
            break;
        }
        LOG_INFO(_logger, "Job " << jobId() << " : " << _httpMethod << " " << uri.toString() << " failed: " << exitInfo
                                 << ", trying again");
    }
    return exitInfo;
}

ExitInfo AbstractNetworkJob::runTrial(const Poco::URI &uri) {
    try {
        openSession(uri);
    } catch (const Poco::Exception &e) {
        return networkFailure("Unable to open a session", e);
    }

    if (const ExitInfo exitInfo = setData(); !exitInfo) {
        LOG_WARN(_logger, "Job " << jobId() << " : unable to build the request body: " << exitInfo);
        return exitInfo;
    }
    if (const ExitInfo exitInfo = sendRequest(uri); !exitInfo) {
        return exitInfo;
    }
    return receiveResponse(uri);
}

void AbstractNetworkJob::openSession(const Poco::URI &uri) {
    closeSession();

    const std::scoped_lock lock(_sessionMutex);
    if (uri.getScheme() == "https") {
        _session = std::make_unique<Poco::Net::HTTPSClientSession>(uri.getHost(), uri.getPort(), sslContext());
    } else {
        _session = std::make_unique<Poco::Net::HTTPClientSession>(uri.getHost(), uri.getPort());
    }
    if (_timeoutSec > 0) _session->setTimeout(Poco::Timespan(_timeoutSec, 0));
}

void AbstractNetworkJob::closeSession() {
    const std::scoped_lock lock(_sessionMutex);
    if (!_session) return;
    try {
        if (_session->connected()) _session->reset();
    } catch (const Poco::Exception &e) {
        LOG_DEBUG(_logger, "Job " << jobId() << " : session reset failed: " << e.displayText());
    }
    _session.reset();
}

ExitInfo AbstractNetworkJob::sendRequest(const Poco::URI &uri) {
    const std::string path = uri.getPathAndQuery();
    Poco::Net::HTTPRequest request(_httpMethod, path.empty() ? "/" : path, Poco::Net::HTTPMessage::HTTP_1_1);
    request.set("User-Agent", CommonUtility::userAgentString());
    if (const std::string contentType = getContentType(); !contentType.empty()) {
        request.setContentType(contentType);
    }
    for (const auto &[key, value]: _rawHeaders) {
        request.add(key, value);
    }
    request.setContentLength(static_cast<std::streamsize>(_data.size()));

    if (isExtendedLog()) {
        LOG_DEBUG(_logger, "Job " << jobId() << " : " << _httpMethod << " " << uri.toString() << " (" << _data.size()
                                  << " bytes)");
    }

    std::ostream *stream = nullptr;
    {
        const std::scoped_lock lock(_sessionMutex);
        if (!_session) return networkFailure("No session", "");
        try {
            stream = &_session->sendRequest(request);
        } catch (const Poco::Exception &e) {
            return networkFailure("Unable to send the request", e);
        }
        if (streamFailed(*stream)) return networkFailure("Unable to send the request", lastSocketError());
    }

    // The lock is released between blocks so that abort() can interrupt a long upload
    for (std::size_t offset = 0; offset < _data.size(); offset += sendBufferSize) {
        const std::scoped_lock lock(_sessionMutex);
        if (isAborted()) return canceled;

        const std::size_t size = std::min(sendBufferSize, _data.size() - offset);
        try {
            stream->write(_data.data() + offset, static_cast<std::streamsize>(size));
        } catch (const Poco::Exception &e) {
            return networkFailure("Unable to send the request body", e);
        }
        if (streamFailed(*stream)) return networkFailure("Unable to send the request body", lastSocketError());
    }

    return ExitCode::Ok;
}

ExitInfo AbstractNetworkJob::receiveResponse(const Poco::URI &uri) {
    std::istream *stream = nullptr;
    {
        const std::scoped_lock lock(_sessionMutex);
        if (!_session) return networkFailure("No session", "");
        try {
            stream = &_session->receiveResponse(_httpResponse);
        } catch (const Poco::Exception &e) {
            return networkFailure("Unable to receive the response", e);
        }
        if (streamFailed(*stream)) return networkFailure("Unable to receive the response", lastSocketError());
    }
    if (isAborted()) return canceled;

    const Poco::Net::HTTPResponse::HTTPStatus status = _httpResponse.getStatus();
    LOG_DEBUG(_logger, "Job " << jobId() << " : " << uri.toString() << " answered " << status << " "
                              << _httpResponse.getReason());

    if (status >= Poco::Net::HTTPResponse::HTTP_INTERNAL_SERVER_ERROR) {
        LOG_WARN(_logger, "Job " << jobId() << " : server error: " << readBody(*stream));
        return {ExitCode::BackError, ExitCause::Http5xx};
    }
    if (status == Poco::Net::HTTPResponse::HTTP_TOO_MANY_REQUESTS) {
        LOG_WARN(_logger, "Job " << jobId() << " : rate limited by the store");
        return ExitCode::RateLimited;
    }
    if (status < Poco::Net::HTTPResponse::HTTP_OK || status >= Poco::Net::HTTPResponse::HTTP_MULTIPLE_CHOICES) {
        return handleError(status, readBody(*stream));
    }

    try {
        return handleResponse(*stream);
    } catch (const Poco::Exception &e) {
        return networkFailure("Unable to read the response body", e);
    } catch (const std::exception &e) {
        LOG_WARN(_logger, "Job " << jobId() << " : unable to handle the response: " << e.what());
        return {ExitCode::BackError, ExitCause::ApiErr};
    }
}

ExitInfo AbstractNetworkJob::handleError(const Poco::Net::HTTPResponse::HTTPStatus status, const std::string &replyBody) {
    LOG_WARN(_logger, "Job " << jobId() << " : status " << status << " : " << replyBody);

    switch (status) {
        case Poco::Net::HTTPResponse::HTTP_NOT_FOUND:
            return {ExitCode::BackError, ExitCause::NotFound};
        case Poco::Net::HTTPResponse::HTTP_FORBIDDEN:
            return {ExitCode::BackError, ExitCause::HttpErrForbidden};
        default:
            return {ExitCode::BackError, ExitCause::HttpErr};
    }
}

ExitInfo AbstractNetworkJob::handleJsonResponse(std::istream &is) {
    const std::string replyBody = readBody(is);
    try {
        _jsonRes = Poco::JSON::Parser().parse(replyBody).extract<Poco::JSON::Object::Ptr>();
    } catch (const Poco::Exception &e) {
        LOG_WARN(_logger, "Job " << jobId() << " : invalid JSON reply: " << e.displayText());
        return {ExitCode::BackError, ExitCause::ApiErr};
    }
    if (!_jsonRes) {
        LOG_WARN(_logger, "Job " << jobId() << " : JSON reply is not an object");
        return {ExitCode::BackError, ExitCause::ApiErr};
    }

    if (isExtendedLog()) LOG_DEBUG(_logger, "Job " << jobId() << " : reply " << replyBody);
    return ExitCode::Ok;
}

ExitInfo AbstractNetworkJob::handleOctetStreamResponse(std::istream &is) {
    _responseBody = readBody(is);
    return ExitCode::Ok;
}

std::string AbstractNetworkJob::readBody(std::istream &is) {
    return {std::istreambuf_iterator<char>(is), std::istreambuf_iterator<char>()};
}

ExitInfo AbstractNetworkJob::networkFailure(const std::string &what, const std::string &detail) {
    LOG_WARN(_logger, "Job " << jobId() << " : " << what << (detail.empty() ? "" : " : ") << detail);
    return {ExitCode::NetworkError, ExitCause::Unknown};
}

ExitInfo AbstractNetworkJob::networkFailure(const std::string &what, const Poco::Exception &e) {
    if (dynamic_cast<const Poco::TimeoutException *>(&e)) {
        LOG_WARN(_logger, "Job " << jobId() << " : " << what << " : no answer within " << _timeoutSec << " s");
        return {ExitCode::NetworkError, ExitCause::NetworkTimeout};
    }

    std::ostringstream detail;
    detail << e.className() << " (" << e.code() << ") " << e.displayText();
    return networkFailure(what, detail.str());
}

std::string AbstractNetworkJob::lastSocketError() const {
    if (!_session) return {};
    const int err = _session->socket().getError();
    return err ? Poco::Error::getMessage(err) : std::string();
}

} // namespace FSC
