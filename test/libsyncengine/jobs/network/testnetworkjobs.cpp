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

#include "testnetworkjobs.h"
#include "jobs/network/networkjobsparams.h"
#include "jobs/network/chunkstore/confirmuploadjob.h"
#include "jobs/network/chunkstore/createfolderjob.h"
#include "jobs/network/chunkstore/downloadchunkjob.h"
#include "jobs/network/chunkstore/negotiateuploadjob.h"
#include "jobs/network/chunkstore/uploadpartjob.h"
#include "requests/parameterscache.h"

#include <Poco/NullStream.h>
#include <Poco/StreamCopier.h>
#include <Poco/Net/HTTPRequestHandler.h>
#include <Poco/Net/HTTPRequestHandlerFactory.h>
#include <Poco/Net/HTTPServerParams.h>
#include <Poco/Net/HTTPServerRequest.h>
#include <Poco/Net/HTTPServerResponse.h>
#include <Poco/Net/ServerSocket.h>
#include <Poco/Net/SocketAddress.h>

#include <deque>
#include <mutex>

using HTTPStatus = Poco::Net::HTTPResponse::HTTPStatus;

namespace FSC {

// Statuses served in order, 200 once the list is empty
struct ScriptedReplies {
        void push(std::initializer_list<HTTPStatus> statuses) {
            const std::scoped_lock lock(mutex);
            replies.insert(replies.end(), statuses.begin(), statuses.end());
            requestCount = 0;
        }

        HTTPStatus next() {
            const std::scoped_lock lock(mutex);
            requestCount++;
            if (replies.empty()) return Poco::Net::HTTPResponse::HTTP_OK;
            const HTTPStatus status = replies.front();
            replies.pop_front();
            return status;
        }

        int count() {
            const std::scoped_lock lock(mutex);
            return requestCount;
        }

        std::mutex mutex;
        std::deque<HTTPStatus> replies;
        int requestCount = 0;
};

namespace {

class ScriptedHandler : public Poco::Net::HTTPRequestHandler {
    public:
        explicit ScriptedHandler(std::shared_ptr<ScriptedReplies> replies) :
            _replies(std::move(replies)) {}

        void handleRequest(Poco::Net::HTTPServerRequest &request, Poco::Net::HTTPServerResponse &response) override {
            Poco::NullOutputStream sink;
            Poco::StreamCopier::copyStream(request.stream(), sink);

            response.setStatusAndReason(_replies->next());
            response.set(etagHeader, "\"etag-1\"");
            response.setContentType(mimeTypeOctetStream);
            response.send() << "bytes";
        }

    private:
        std::shared_ptr<ScriptedReplies> _replies;
};

class ScriptedHandlerFactory : public Poco::Net::HTTPRequestHandlerFactory {
    public:
        explicit ScriptedHandlerFactory(std::shared_ptr<ScriptedReplies> replies) :
            _replies(std::move(replies)) {}

        Poco::Net::HTTPRequestHandler *createRequestHandler(const Poco::Net::HTTPServerRequest &) override {
            return new ScriptedHandler(_replies);
        }

    private:
        std::shared_ptr<ScriptedReplies> _replies;
};

} // namespace

void TestNetworkJobs::setUp() {
    start();

    Parameters &parameters = ParametersCache::instance(true)->parameters();
    parameters.setMaxRetries(3);
    parameters.setRetryBackoffMs(1);
    parameters.setRequestTimeoutSec(10);

    _replies = std::make_shared<ScriptedReplies>();
    Poco::Net::HTTPServerParams::Ptr serverParams = new Poco::Net::HTTPServerParams;
    serverParams->setKeepAlive(false);
    const Poco::Net::HTTPRequestHandlerFactory::Ptr factory = new ScriptedHandlerFactory(_replies);
    const Poco::Net::ServerSocket socket(Poco::Net::SocketAddress("127.0.0.1", 0));
    _server = std::make_unique<Poco::Net::HTTPServer>(factory, socket, serverParams);
    _server->start();
    _apiUrl = "http://127.0.0.1:" + std::to_string(_server->port());
}

void TestNetworkJobs::tearDown() {
    _server->stop();
    _server.reset();
    _replies.reset();
    ParametersCache::reset();
    stop();
}

void TestNetworkJobs::testServerErrorRetried() {
    TransferHandle handle;
    handle.uploadId = "upload_1";
    handle.url = _apiUrl + "/parts/1";

    _replies->push({Poco::Net::HTTPResponse::HTTP_SERVICE_UNAVAILABLE});
    UploadPartJob job(handle, "bytes");
    CPPUNIT_ASSERT(job.runSynchronously());
    CPPUNIT_ASSERT_EQUAL(2, _replies->count());
    CPPUNIT_ASSERT_EQUAL(std::string("\"etag-1\""), job.ack().etag);
}

void TestNetworkJobs::testServerErrorExhausted() {
    _replies->push({Poco::Net::HTTPResponse::HTTP_INTERNAL_SERVER_ERROR, Poco::Net::HTTPResponse::HTTP_BAD_GATEWAY,
                    Poco::Net::HTTPResponse::HTTP_SERVICE_UNAVAILABLE});
    DownloadChunkJob job(_apiUrl, {"abc", ""});
    const ExitInfo exitInfo = job.runSynchronously();
    CPPUNIT_ASSERT(exitInfo == ExitInfo(ExitCode::BackError, ExitCause::Http5xx));
    CPPUNIT_ASSERT(exitInfo.isRecoverable());
    CPPUNIT_ASSERT_EQUAL(3, _replies->count());
}

void TestNetworkJobs::testRateLimitRetried() {
    _replies->push({Poco::Net::HTTPResponse::HTTP_TOO_MANY_REQUESTS, Poco::Net::HTTPResponse::HTTP_TOO_MANY_REQUESTS});
    DownloadChunkJob job(_apiUrl, {"abc", ""});
    CPPUNIT_ASSERT(job.runSynchronously());
    CPPUNIT_ASSERT_EQUAL(3, _replies->count());
    CPPUNIT_ASSERT_EQUAL(std::string("bytes"), job.responseBody());

    _replies->push({Poco::Net::HTTPResponse::HTTP_TOO_MANY_REQUESTS, Poco::Net::HTTPResponse::HTTP_TOO_MANY_REQUESTS,
                    Poco::Net::HTTPResponse::HTTP_TOO_MANY_REQUESTS});
    DownloadChunkJob limitedJob(_apiUrl, {"abc", ""});
    CPPUNIT_ASSERT(limitedJob.runSynchronously() == ExitCode::RateLimited);
    CPPUNIT_ASSERT_EQUAL(3, _replies->count());
}

void TestNetworkJobs::testClientErrorNotRetried() {
    _replies->push({Poco::Net::HTTPResponse::HTTP_NOT_FOUND});
    ConfirmUploadJob confirmJob(_apiUrl, ConfirmRequest());
    CPPUNIT_ASSERT(confirmJob.runSynchronously() == ExitInfo(ExitCode::BackError, ExitCause::NotFound));
    CPPUNIT_ASSERT_EQUAL(1, _replies->count());

    _replies->push({Poco::Net::HTTPResponse::HTTP_BAD_REQUEST});
    NegotiateUploadJob negotiateJob(_apiUrl, NegotiationRequest());
    CPPUNIT_ASSERT(negotiateJob.runSynchronously() == ExitInfo(ExitCode::BackError, ExitCause::HttpErr));
    CPPUNIT_ASSERT_EQUAL(1, _replies->count());

    // Without a presigned location, 403 is a plain refusal
    _replies->push({Poco::Net::HTTPResponse::HTTP_FORBIDDEN});
    DownloadChunkJob downloadJob(_apiUrl, {"abc", ""});
    CPPUNIT_ASSERT(downloadJob.runSynchronously() == ExitInfo(ExitCode::BackError, ExitCause::HttpErrForbidden));
    CPPUNIT_ASSERT_EQUAL(1, _replies->count());
}

void TestNetworkJobs::testTransferHandleExpired() {
    TransferHandle handle;
    handle.uploadId = "upload_1";
    handle.url = _apiUrl + "/parts/1";

    for (const HTTPStatus status: {Poco::Net::HTTPResponse::HTTP_FORBIDDEN, Poco::Net::HTTPResponse::HTTP_GONE}) {
        _replies->push({status});
        UploadPartJob uploadJob(handle, "bytes");
        CPPUNIT_ASSERT(uploadJob.runSynchronously() == ExitInfo(ExitCode::BackError, ExitCause::TransferHandleExpired));
        CPPUNIT_ASSERT_EQUAL(1, _replies->count());

        _replies->push({status});
        DownloadChunkJob downloadJob(_apiUrl, {"abc", _apiUrl + "/presigned/abc"});
        CPPUNIT_ASSERT(downloadJob.runSynchronously() == ExitInfo(ExitCode::BackError, ExitCause::TransferHandleExpired));
        CPPUNIT_ASSERT_EQUAL(1, _replies->count());
    }
}

void TestNetworkJobs::testConflict() {
    _replies->push({Poco::Net::HTTPResponse::HTTP_CONFLICT});
    NegotiateUploadJob negotiateJob(_apiUrl, NegotiationRequest());
    CPPUNIT_ASSERT(negotiateJob.runSynchronously() == ExitInfo(ExitCode::BackError, ExitCause::NegotiationConflict));
    CPPUNIT_ASSERT_EQUAL(1, _replies->count());

    _replies->push({Poco::Net::HTTPResponse::HTTP_CONFLICT});
    ConfirmUploadJob confirmJob(_apiUrl, ConfirmRequest());
    CPPUNIT_ASSERT(confirmJob.runSynchronously() == ExitInfo(ExitCode::BackError, ExitCause::ConfirmRejected));
    CPPUNIT_ASSERT_EQUAL(1, _replies->count());

    // An existing folder is already registered
    _replies->push({Poco::Net::HTTPResponse::HTTP_CONFLICT});
    CreateFolderJob folderJob(_apiUrl, DbFolder("folder_1", "/docs", "docs", std::nullopt));
    CPPUNIT_ASSERT(folderJob.runSynchronously());
    CPPUNIT_ASSERT_EQUAL(1, _replies->count());
}

} // namespace FSC
