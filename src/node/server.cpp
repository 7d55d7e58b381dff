#include <spdlog/spdlog.h>
#include <warden/node/server.hpp>

using namespace warden::node;
using namespace warden::schema;

namespace {

grpc::ServerUnaryReactor* finish_ok(grpc::CallbackServerContext* context) {
  auto* reactor = context->DefaultReactor();
  reactor->Finish(grpc::Status::OK);
  return reactor;
}

void populate_tx_response(const transaction_result_t& source,
                          warden::node::v1::TxResponse* destination) {
  destination->set_code(source.code);
  destination->set_data(make_string(source.data));
  destination->set_log(source.log);
  destination->set_info(source.info);
  destination->set_codespace(source.codespace);
  for (const auto& event : source.events) {
    auto* out = destination->add_events();
    out->set_type(event.type);
    for (const auto& attribute : event.attributes) {
      auto* out_attribute = out->add_attributes();
      out_attribute->set_key(attribute.key);
      out_attribute->set_value(attribute.value);
      out_attribute->set_index(attribute.index);
    }
  }
}

}  // namespace

listener::listener(warden::execution::engine& engine)
    : execution_engine_{engine} {}

grpc::ServerUnaryReactor* listener::Info(
    grpc::CallbackServerContext* context,
    const warden::node::v1::InfoRequest* /*request*/,
    warden::node::v1::InfoResponse* response) {
  auto info = execution_engine_.info();
  response->set_data(info.data);
  response->set_version(info.version);
  response->set_app_version(info.app_version);
  response->set_last_height(info.last_height);
  response->set_last_state_root(make_string(
      bytes_view_t{info.last_state_root.data(), info.last_state_root.size()}));
  response->set_chain_id(
      make_string(bytes_view_t{info.chain_id.data(), info.chain_id.size()}));
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::CheckTx(
    grpc::CallbackServerContext* context,
    const warden::node::v1::TxRequest* request,
    warden::node::v1::TxResponse* response) {
  auto tx = make_bytes(request->tx());
  auto check =
      execution_engine_.check_transaction(bytes_view_t{tx.data(), tx.size()});
  populate_tx_response(check, response);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Submit(
    grpc::CallbackServerContext* context,
    const warden::node::v1::TxRequest* request,
    warden::node::v1::TxResponse* response) {
  auto tx = make_bytes(request->tx());
  auto result = execution_engine_.execute(bytes_view_t{tx.data(), tx.size()});
  if (result.code != 0) {
    spdlog::debug("Submitted request failed: {} {}", result.log, result.info);
  }
  populate_tx_response(result, response);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Query(
    grpc::CallbackServerContext* context,
    const warden::node::v1::QueryRequest* request,
    warden::node::v1::QueryResponse* response) {
  auto data = make_bytes(request->data());
  auto query = execution_engine_.query(request->path(),
                                       bytes_view_t{data.data(), data.size()});
  response->set_code(query.code);
  response->set_log(query.log);
  response->set_info(query.info);
  response->set_key(make_string(query.key));
  response->set_value(make_string(query.value));
  response->set_height(query.height);
  response->set_codespace(query.codespace);
  return finish_ok(context);
}
