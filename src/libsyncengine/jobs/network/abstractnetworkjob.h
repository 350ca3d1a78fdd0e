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
#pragma once

#include "jobs/abstractjob.h"

#include <Poco/Exception.h>
#include <Poco/JSON/Object.h>
#include <Poco/Net/HTTPClientSession.h>
#include <Poco/Net/HTTPResponse.h>
#include <Poco/URI.h>

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace FSC {

/**
 * Base class of the jobs talking to the chunk store over HTTP(S).
 *
 * A job sends one request and hands the 2xx body to handleResponse(), any other status to handleError().
 * Transport failures, 429 and 5xx replies are tried again up to maxRetries trials in all, the delay doubling from
 * retryBackoffMs. The last failure is returned: NetworkError, RateLimited or BackError with ExitCause::Http5xx.
 */
class AbstractNetworkJob : public AbstractJob {
    public:
        AbstractNetworkJob();
        ~AbstractNetworkJob() override;

        //! Also interrupts a request in flight.
        void abort() override;

        const Poco::Net::HTTPResponse &httpResponse() const { return _httpResponse; }
        const std::string &responseBody() const { return _responseBody; }
        Poco::JSON::Object::Ptr jsonRes() const { return _jsonRes; }

    protected:
        ExitInfo runJob() noexcept override;

        virtual std::string getUrl() = 0;
        //! Fills _data before each trial.
        virtual ExitInfo setData() { return ExitCode::Ok; }
        virtual std::string getContentType() { return {}; }
        virtual ExitInfo handleResponse(std::istream &is) = 0;
        virtual ExitInfo handleError(Poco::Net::HTTPResponse::HTTPStatus status, const std::string &replyBody);

        void addRawHeader(const std::string &key, const std::string &value) { _rawHeaders.insert_or_assign(key, value); }

        ExitInfo handleJsonResponse(std::istream &is);
        ExitInfo handleOctetStreamResponse(std::istream &is);
        static std::string readBody(std::istream &is);

        std::string _httpMethod;
        std::string _data;

    private:
        ExitInfo runTrial(const Poco::URI &uri);
        void openSession(const Poco::URI &uri);
        void closeSession();
        ExitInfo sendRequest(const Poco::URI &uri);
        ExitInfo receiveResponse(const Poco::URI &uri);

        ExitInfo networkFailure(const std::string &what, const std::string &detail);
        ExitInfo networkFailure(const std::string &what, const Poco::Exception &e);
        //! Requires _sessionMutex.
        std::string lastSocketError() const;

        int _timeoutSec = 0;
        int _trials = 1;
        int _backoffMs = 0;
        std::unordered_map<std::string, std::string> _rawHeaders;

        std::unique_ptr<Poco::Net::HTTPClientSession> _session;
        std::mutex _sessionMutex;

        Poco::Net::HTTPResponse _httpResponse;
        std::string _responseBody;
        Poco::JSON::Object::Ptr _jsonRes;
};

} // namespace FSC
