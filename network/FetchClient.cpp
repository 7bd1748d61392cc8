#include "FetchClient.h"
#include "TcpClient.h"

namespace lw {
namespace network {

FetchClient::FetchClient() : Module("network.fetch_client") {}

FetchClient::Roe<std::string>
FetchClient::fetchSync(const TcpEndpoint &endpoint, const std::string &data,
                       std::chrono::milliseconds timeout) {
  log().debug << "Fetching from " << endpoint << " (" << data.size()
              << " bytes)";

  TcpClient client;
  auto connectResult = client.connect(endpoint, timeout);
  if (!connectResult) {
    return Error(E_CONNECT, connectResult.error().message);
  }

  auto sendResult = client.sendAndShutdown(data);
  if (!sendResult) {
    return Error(E_SEND, "Failed to send request: " + sendResult.error().message);
  }

  auto response = client.receiveAll();
  if (!response) {
    return Error(E_RECEIVE, "Failed to read response: " + response.error().message);
  }

  log().debug << "Received response (" << response.value().size() << " bytes)";
  return response.value();
}

} // namespace network
} // namespace lw
