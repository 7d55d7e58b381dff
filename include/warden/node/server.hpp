#pragma once

#include <warden/execution/engine.hpp>
#include <warden/node/v1/node.grpc.pb.h>

namespace warden::node {

/// Callback gRPC front end of the engine.
///
/// - Info: committed height, state root and chain id.
/// - CheckTx: decode and validate a request; no state change.
/// - Submit: execute a request and commit it.
/// - Query: read-only route against committed state.
struct listener final : public warden::node::v1::Node::CallbackService {
  explicit listener(warden::execution::engine& engine);

  virtual grpc::ServerUnaryReactor* Info(
      grpc::CallbackServerContext* context,
      const warden::node::v1::InfoRequest* request,
      warden::node::v1::InfoResponse* response) override final;

  virtual grpc::ServerUnaryReactor* CheckTx(
      grpc::CallbackServerContext* context,
      const warden::node::v1::TxRequest* request,
      warden::node::v1::TxResponse* response) override final;

  virtual grpc::ServerUnaryReactor* Submit(
      grpc::CallbackServerContext* context,
      const warden::node::v1::TxRequest* request,
      warden::node::v1::TxResponse* response) override final;

  virtual grpc::ServerUnaryReactor* Query(
      grpc::CallbackServerContext* context,
      const warden::node::v1::QueryRequest* request,
      warden::node::v1::QueryResponse* response) override final;

 private:
  warden::execution::engine& execution_engine_;
};

}  // namespace warden::node
