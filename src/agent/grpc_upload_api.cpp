#include "grpc_upload_api.h"
#include "utils.h"

#include <chrono>

namespace ua {

GrpcUploadApi::GrpcUploadApi(std::shared_ptr<rpc::UploadService::StubInterface> stub, int timeout_ms)
    : stub_(std::move(stub)), timeout_ms_(timeout_ms) {
}

std::unique_ptr<GrpcUploadApi> GrpcUploadApi::connect(const std::string& address, int timeout_ms) {
    auto channel = grpc::CreateChannel(address, grpc::InsecureChannelCredentials());
    std::shared_ptr<rpc::UploadService::StubInterface> stub = rpc::UploadService::NewStub(channel);
    return std::make_unique<GrpcUploadApi>(std::move(stub), timeout_ms);
}

void GrpcUploadApi::setDeadline(grpc::ClientContext* context) const {
    context->set_deadline(std::chrono::system_clock::now() + std::chrono::milliseconds(timeout_ms_));
}

Status GrpcUploadApi::fromGrpcStatus(const grpc::Status& status, const std::string& context) {
    if (status.ok()) {
        return Status::OK();
    }
    std::string message = context + ": " + status.error_message();
    switch (status.error_code()) {
        case grpc::StatusCode::UNAVAILABLE:
        case grpc::StatusCode::DEADLINE_EXCEEDED:
        case grpc::StatusCode::RESOURCE_EXHAUSTED:
        case grpc::StatusCode::ABORTED:
        case grpc::StatusCode::INTERNAL:
        case grpc::StatusCode::UNKNOWN:
        case grpc::StatusCode::CANCELLED:
            return Status(ErrorCode::TransientTransportError, message);
        default:
            return Status(ErrorCode::RemoteRejectedChunk, message);
    }
}

Status GrpcUploadApi::requestSlot(const SlotRequest& request, UploadSlot* slot) {
    rpc::SlotRequest rpc_request;
    rpc_request.set_file_id(request.file_id);
    rpc_request.set_part_index(request.chunk_index + 1);
    rpc_request.set_size(request.size);
    rpc_request.set_md5(request.md5);
    rpc_request.set_compressed(request.compressed);

    rpc::SlotResponse rpc_response;
    grpc::ClientContext context;
    setDeadline(&context);

    grpc::Status status = stub_->RequestUploadSlot(&context, rpc_request, &rpc_response);
    if (!status.ok()) {
        return fromGrpcStatus(status, "RequestUploadSlot(chunk " + std::to_string(request.chunk_index) + ")");
    }
    if (rpc_response.url().empty()) {
        return Status(ErrorCode::TransientTransportError,
                      "RequestUploadSlot returned no URL for chunk " + std::to_string(request.chunk_index));
    }

    slot->url = rpc_response.url();
    slot->headers.clear();
    for (const auto& header : rpc_response.headers()) {
        slot->headers[header.first] = header.second;
    }
    slot->expires_at_ms = rpc_response.expires_at_ms();
    return Status::OK();
}

Status GrpcUploadApi::closeFile(const std::string& file_id) {
    rpc::CloseFileRequest rpc_request;
    rpc_request.set_file_id(file_id);

    rpc::CloseFileResponse rpc_response;
    grpc::ClientContext context;
    setDeadline(&context);

    grpc::Status status = stub_->CloseFile(&context, rpc_request, &rpc_response);
    if (!status.ok()) {
        return fromGrpcStatus(status, "CloseFile(" + file_id + ")");
    }
    Utils::logDebug("File " + file_id + " is now " + rpc_response.state());
    return Status::OK();
}

} // namespace ua
