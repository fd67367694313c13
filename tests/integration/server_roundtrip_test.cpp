#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <cassert>
#include <iostream>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include "client/cpp/booking_client.h"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/wire/frame_codec.hpp"
#include "internal/wire/payload.hpp"
#include "tests/support/test_support.hpp"

namespace {

using booking::client::BookingClient;
using booking::wire::GetInt;
using booking::wire::GetString;

struct Engine {
  booking::factory::Application app;
  uint16_t                      book  = 0;
  uint16_t                      avail = 0;
  uint16_t                      incid = 0;

  Engine() {
    booking::runtime::config::RuntimeConfig config;
    for (const char* service : {"book", "avail", "incid"}) {
      auto* listener = config.mutable_server()->add_listeners();
      listener->set_service(service);
      listener->set_bind_address("127.0.0.1:0");
    }
    config.mutable_server()->set_io_timeout_ms(2000);
    booking::config::ConfigLoader::Normalize(config);

    app = booking::factory::Build(config);
    booking::testing::SeedDirectory(*app.repository);

    for (auto& server : app.servers) {
      server->Start();
      if (server->Service() == "book") book = server->Port();
      if (server->Service() == "avail") avail = server->Port();
      if (server->Service() == "incid") incid = server->Port();
    }
    assert(book != 0 && avail != 0 && incid != 0);
  }

  ~Engine() {
    Stop();
  }

  void Stop() {
    for (auto& server : app.servers) {
      server->Stop();
    }
  }
};

// Raw socket exchange: send bytes, read until the server closes.
std::string SendRaw(uint16_t port, const std::string& bytes) {
  const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  assert(fd >= 0);

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port   = htons(port);
  const int parsed = ::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
  assert(parsed == 1);
  const int rc = ::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
  assert(rc == 0);

  const ssize_t sent = ::send(fd, bytes.data(), bytes.size(), MSG_NOSIGNAL);
  assert(sent == static_cast<ssize_t>(bytes.size()));

  std::string reply;
  char        chunk[1024];
  for (;;) {
    const ssize_t n = ::recv(fd, chunk, sizeof(chunk), 0);
    if (n <= 0) break;
    reply.append(chunk, static_cast<std::size_t>(n));
  }
  ::close(fd);
  return reply;
}

void TestBookingRoundTrip(Engine& engine) {
  BookingClient client("127.0.0.1", engine.book);

  auto created = client.CreateBooking(2, 1, "2025-05-05T14:00", "2025-05-05T16:00", "Estudio");
  assert(!BookingClient::IsError(created));
  assert(GetString(created, "estado") == "pendiente");
  const auto id = *GetInt(created, "id");

  // Same connection carries further requests, including failed ones.
  auto clash = client.CreateBooking(3, 1, "2025-05-05T15:00", "2025-05-05T17:00", "");
  assert(BookingClient::IsError(clash));
  assert(GetString(clash, "code") == "slot_unavailable");

  auto adjacent = client.CreateBooking(3, 1, "2025-05-05T16:00", "2025-05-05T18:00", "");
  assert(!BookingClient::IsError(adjacent));

  auto decided = client.DecideBooking(id, true, 1);
  assert(GetString(decided, "estado") == "aprobada");

  auto listed = client.CallJson("book", R"({"user":2})");
  assert(listed.list_value().values_size() == 1);

  BookingClient calendar_client("127.0.0.1", engine.avail);
  auto          calendar = calendar_client.Calendar(1, "2025-05-05");
  const auto&   slots    = calendar.struct_value().fields().at("horarios").list_value();
  assert(slots.values_size() == 14);
  const auto& two_pm = slots.values(6);
  assert(GetString(two_pm, "hora") == "14:00");
  assert(!two_pm.struct_value().fields().at("disponible").bool_value());
  assert(GetInt(two_pm, "reserva_id") == id);
  assert(GetString(two_pm, "estado") == "aprobada");

  auto cancelled = client.CancelBooking(id, 2);
  assert(cancelled.struct_value().fields().at("cancelled").bool_value());
}

void TestWrongServiceKeepsConnection(Engine& engine) {
  BookingClient client("127.0.0.1", engine.avail);
  auto          wrong = client.CallJson("book", R"({"user":2})");
  assert(GetString(wrong, "code") == "wrong_service");

  auto check = client.CallJson("avail", R"({"fecha":"2025-05-06","tipo":"auditorio"})");
  assert(check.list_value().values_size() == 1);
}

void TestIncidentOverTheWire(Engine& engine) {
  BookingClient book("127.0.0.1", engine.book);
  BookingClient incid("127.0.0.1", engine.incid);

  book.CreateBooking(2, 5, "2025-05-07T10:00", "2025-05-07T11:00", "Ensayo");

  auto reported = incid.CallJson("incid", R"({"space":5,"tipo":"averia","descripcion":"Sin sonido"})");
  const auto incident = std::to_string(*GetInt(reported, "id_incidencia"));

  auto blocked = incid.CallJson("incid", R"({"incidencia":)" + incident +
                                             R"(,"inicio":"2025-05-07T09:00","fin":"2025-05-07T12:00"})");
  assert(blocked.struct_value().fields().at("bloqueado").bool_value());
  assert(GetInt(blocked, "reservas_canceladas") == 1);

  auto refused = book.CreateBooking(3, 5, "2025-05-07T11:00", "2025-05-07T12:00", "");
  assert(GetString(refused, "code") == "slot_unavailable");

  auto resolved = incid.CallJson("incid", R"({"accion":"resolver","incidencia":)" + incident + "}");
  assert(resolved.struct_value().fields().at("espacio_liberado").bool_value());
  assert(!BookingClient::IsError(book.CreateBooking(3, 5, "2025-05-07T11:00", "2025-05-07T12:00", "")));
}

void TestRacingClients(Engine& engine) {
  constexpr int            kClients = 8;
  std::atomic<int>         winners{0};
  std::atomic<int>         losers{0};
  std::vector<std::thread> threads;

  for (int i = 0; i < kClients; ++i) {
    threads.emplace_back([&, i] {
      BookingClient client("127.0.0.1", engine.book);
      const auto    minute = std::to_string(10 + i);
      auto          reply  = client.CreateBooking(2, 2, "2025-05-08T09:" + minute, "2025-05-08T10:" + minute, "race");
      if (BookingClient::IsError(reply)) {
        assert(GetString(reply, "code") == "slot_unavailable");
        losers.fetch_add(1);
      } else {
        winners.fetch_add(1);
      }
    });
  }
  for (auto& t : threads) t.join();

  assert(winners.load() == 1);
  assert(losers.load() == kClients - 1);
}

void TestMalformedFrameGetsErrorThenClose(Engine& engine) {
  const auto reply = SendRaw(engine.book, "12x45book {}");
  assert(!reply.empty());

  const auto frame = booking::wire::Decode(reply);
  assert(booking::wire::TrimTag(frame.tag) == "book");
  assert(GetString(frame.payload, "code") == "bad_request");

  // Unparseable JSON body.
  const std::string body = "book {not json";
  const auto        len  = std::string(5 - std::to_string(body.size()).size(), '0') + std::to_string(body.size());
  const auto        bad  = booking::wire::Decode(SendRaw(engine.book, len + body));
  assert(GetString(bad.payload, "code") == "bad_request");
}

void TestStopDrainsIdleConnections() {
  Engine        engine;
  BookingClient idle("127.0.0.1", engine.book);
  idle.Connect();
  assert(!BookingClient::IsError(idle.CallJson("book", R"({"user":3})")));

  // Returns although the client never hangs up.
  engine.Stop();

  bool refused = false;
  try {
    BookingClient late("127.0.0.1", engine.book);
    late.Connect();
  } catch (const std::system_error&) {
    refused = true;
  }
  assert(refused);
}

} // namespace

int main() {
  {
    Engine engine;
    TestBookingRoundTrip(engine);
    TestWrongServiceKeepsConnection(engine);
    TestIncidentOverTheWire(engine);
    TestRacingClients(engine);
    TestMalformedFrameGetsErrorThenClose(engine);
  }
  TestStopDrainsIdleConnections();

  std::cout << "booking_engine_integration_server_roundtrip: pass\n";
  return 0;
}
