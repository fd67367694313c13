#include <cstdint>
#include <iostream>
#include <string>

#include "client/cpp/booking_client.h"
#include "internal/wire/frame_codec.hpp"
#include "internal/wire/payload.hpp"

static void Usage() {
  std::cout << "Usage:\n"
            << "  bookingctl <host:port> <tag> '<json>'\n"
            << "\n"
            << "Examples:\n"
            << "  bookingctl 127.0.0.1:5001 book '{\"user\":2,\"space\":1,\"inicio\":\"2025-01-20T14:00\",\"fin\":\"2025-01-20T16:00\"}'\n"
            << "  bookingctl 127.0.0.1:5002 avail '{\"space\":1,\"fecha\":\"2025-01-20\"}'\n"
            << "  bookingctl 127.0.0.1:5003 incid '{\"incidencia\":3}'\n";
}

static bool SplitAddress(const std::string& address, std::string* host, uint16_t* port) {
  const auto colon = address.rfind(':');
  if (colon == std::string::npos || colon == 0 || colon + 1 == address.size()) {
    return false;
  }
  try {
    const auto value = std::stoul(address.substr(colon + 1));
    if (value == 0 || value > 65535) return false;
    *port = static_cast<uint16_t>(value);
  } catch (const std::exception&) {
    return false;
  }
  *host = address.substr(0, colon);
  return true;
}

int main(int argc, char** argv) {
  if (argc != 4) {
    Usage();
    return 1;
  }

  std::string host;
  uint16_t    port = 0;
  if (!SplitAddress(argv[1], &host, &port)) {
    std::cerr << "invalid address '" << argv[1] << "', expected host:port\n";
    return 1;
  }

  const std::string tag = argv[2];
  if (tag.empty() || tag.size() > booking::wire::kTagWidth) {
    std::cerr << "tag must be 1 to " << booking::wire::kTagWidth << " characters\n";
    return 1;
  }

  try {
    booking::client::BookingClient client(host, port);
    const auto                     response = client.CallJson(tag, argv[3]);
    std::cout << booking::wire::ToJson(response) << "\n";
    return booking::client::BookingClient::IsError(response) ? 3 : 0;
  } catch (const std::invalid_argument& e) {
    std::cerr << e.what() << "\n";
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "request failed: " << e.what() << "\n";
    return 2;
  }
}
