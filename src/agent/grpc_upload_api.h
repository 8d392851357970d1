#pragma once

#include "upload_api.h"
#include "upload_service.grpc.pb.h"

#include <grpcpp/grpcpp.h>

#include <memory>

namespace ua {

// UploadApi over the ua.rpc.UploadService gRPC service
class GrpcUploadApi : public UploadApi {
public:
    GrpcUploadApi(std::shared_ptr<rpc::UploadService::StubInterface> stub, int timeout_ms);

    // Convenience: plaintext channel to host:port
    static std::unique_ptr<GrpcUploadApi> connect(const std::string& address, int timeout_ms);

    Status requestSlot(const SlotRequest& request, UploadSlot* slot) override;
    Status closeFile(const std::string& file_id) override;

    static Status fromGrpcStatus(const grpc::Status& status, const std::string& context);

private:
    void setDeadline(grpc::ClientContext* context) const;

    std::shared_ptr<rpc::UploadService::StubInterface> stub_;
    int timeout_ms_;
};

} // namespace ua
