#include "test_framework.hpp"

#include "tests/helpers/test_helpers.hpp"
#include "wiredrive/common/fs.hpp"
#include "wiredrive/driver/port_allocator.hpp"
#include "wiredrive/driver/profile.hpp"
#include "wiredrive/driver/readiness.hpp"
#include "wiredrive/driver/zip_archive.hpp"

#include <chrono>
#include <memory>
#include <set>
#include <sstream>
#include <thread>
#include <variant>

namespace {

using Clock = std::chrono::steady_clock;

long long elapsed_ms(const Clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count();
}

// A base port whose lock port and first few candidates are currently free.
std::uint16_t free_base_port() {
  for (std::uint32_t base = 31000; base < 60000; base += 97) {
    bool all_free = true;
    for (std::uint32_t port = base - 1; port < base + 8; ++port) {
      if (!wiredrive::driver::is_port_available(static_cast<std::uint16_t>(port))) {
        all_free = false;
        break;
      }
    }
    if (all_free) {
      return static_cast<std::uint16_t>(base);
    }
  }
  throw std::runtime_error("no free port range found");
}

void overwrite_u32(std::string &bytes, const std::size_t pos, const std::uint32_t value) {
  for (std::size_t i = 0; i < 4; ++i) {
    bytes[pos + i] = static_cast<char>((value >> (8U * i)) & 0xFFU);
  }
}

// Rewrites the uncompressed size of the first entry in both its local and central headers.
void set_declared_size(std::string &bytes, const std::uint32_t size) {
  overwrite_u32(bytes, bytes.find(std::string("PK\x03\x04", 4)) + 22, size);
  overwrite_u32(bytes, bytes.find(std::string("PK\x01\x02", 4)) + 24, size);
}

std::size_t count_lines(const std::string &text) {
  std::istringstream stream(text);
  std::string line;
  std::size_t lines = 0;
  while (std::getline(stream, line)) {
    if (!line.empty()) {
      ++lines;
    }
  }
  return lines;
}

} // namespace

void register_driver_tests(std::vector<wiredrive::tests::TestCase> &tests) {
  using wiredrive::tests::require;
  using wiredrive::testing::TempWorkspace;
  namespace driver = wiredrive::driver;
  namespace common = wiredrive::common;
  namespace cfg = wiredrive::config;

  tests.push_back({"allocate_port_returns_requested_port", [] {
                     const auto allocation = driver::allocate_port(4444, driver::PortAllocatorOptions{});
                     require(allocation.ok(), "fixed port should succeed");
                     require(allocation.value().port == 4444, "requested port should be returned");
                     require(!allocation.value().lease.held(), "fixed port takes no lock");
                   }});

  tests.push_back({"allocate_port_scans_from_base", [] {
                     const auto base = free_base_port();
                     const auto allocation = driver::allocate_port(
                         0, driver::PortAllocatorOptions{.base_port = base,
                                                         .lock_timeout = std::chrono::milliseconds(500),
                                                         .lock_retry_interval = std::chrono::milliseconds(20)});
                     require(allocation.ok(), allocation.ok() ? "" : allocation.error().message);
                     require(allocation.value().port >= base, "port below base");
                     require(allocation.value().lease.held(), "lease should be held");
                     require(allocation.value().lease.lock_port() == base - 1, "lock port should be base-1");
                     require(!driver::is_port_available(static_cast<std::uint16_t>(base - 1)),
                             "lock port should be bound while held");
                   }});

  tests.push_back({"serialized_allocations_never_repeat", [] {
                     const auto base = free_base_port();
                     const driver::PortAllocatorOptions options{
                         .base_port = base,
                         .lock_timeout = std::chrono::milliseconds(500),
                         .lock_retry_interval = std::chrono::milliseconds(20)};
                     std::vector<std::unique_ptr<wiredrive::testing::TcpListener>> drivers;
                     std::set<std::uint16_t> seen;
                     for (int i = 0; i < 5; ++i) {
                       auto allocation = driver::allocate_port(0, options);
                       require(allocation.ok(), allocation.ok() ? "" : allocation.error().message);
                       const auto port = allocation.value().port;
                       require(port >= base, "port below base");
                       require(seen.insert(port).second, "port handed out twice");
                       // The "driver" binds before the lease is released.
                       drivers.push_back(std::make_unique<wiredrive::testing::TcpListener>(port));
                       require(drivers.back()->listening(), "listener should bind the allocated port");
                     }
                   }});

  tests.push_back({"allocate_port_times_out_on_held_lock", [] {
                     const auto base = free_base_port();
                     auto held = driver::acquire_port_lock(static_cast<std::uint16_t>(base - 1),
                                                           std::chrono::milliseconds(500),
                                                           std::chrono::milliseconds(20));
                     require(held.ok(), "first lock should succeed");

                     const auto start = Clock::now();
                     const auto allocation = driver::allocate_port(
                         0, driver::PortAllocatorOptions{.base_port = base,
                                                         .lock_timeout = std::chrono::milliseconds(200),
                                                         .lock_retry_interval = std::chrono::milliseconds(50)});
                     require(!allocation.ok(), "contended lock should time out");
                     require(allocation.error().kind == common::ErrorKind::Timeout, "timeout expected");
                     require(elapsed_ms(start) >= 190, "should wait for the lock timeout");

                     held.value().release();
                     const auto retried = driver::allocate_port(
                         0, driver::PortAllocatorOptions{.base_port = base,
                                                         .lock_timeout = std::chrono::milliseconds(200),
                                                         .lock_retry_interval = std::chrono::milliseconds(50)});
                     require(retried.ok(), "released lock should be acquirable");
                   }});

  tests.push_back({"allocate_port_rejects_tiny_base", [] {
                     const auto allocation =
                         driver::allocate_port(0, driver::PortAllocatorOptions{.base_port = 1});
                     require(!allocation.ok(), "base port 1 has no lock port");
                     require(allocation.error().kind == common::ErrorKind::Config, "config error expected");
                   }});

  tests.push_back({"readiness_times_out_on_unbound_port", [] {
                     const auto port = wiredrive::testing::unused_port();
                     const auto start = Clock::now();
                     const auto status = driver::wait_until_listening(
                         port, driver::ProbeOptions{.timeout = std::chrono::milliseconds(300),
                                                    .interval = std::chrono::milliseconds(50)});
                     const auto waited = elapsed_ms(start);
                     require(!status.ok(), "probe should fail");
                     require(status.error().kind == common::ErrorKind::Timeout, "timeout expected");
                     require(status.error().message == "start failed: timeout expired",
                             "message mismatch: " + status.error().message);
                     require(waited >= 300, "returned before the timeout");
                     require(waited < 300 + 50 + 250, "overshot the timeout by more than one interval");
                   }});

  tests.push_back({"readiness_succeeds_when_listener_appears", [] {
                     const auto port = wiredrive::testing::unused_port();
                     std::unique_ptr<wiredrive::testing::TcpListener> listener;
                     Clock::time_point bound_at;
                     std::thread binder([&] {
                       std::this_thread::sleep_for(std::chrono::milliseconds(200));
                       listener = std::make_unique<wiredrive::testing::TcpListener>(port);
                       bound_at = Clock::now();
                     });

                     const auto status = driver::wait_until_listening(
                         port, driver::ProbeOptions{.timeout = std::chrono::milliseconds(3000),
                                                    .interval = std::chrono::milliseconds(50)});
                     const auto finished_at = Clock::now();
                     binder.join();
                     require(listener != nullptr && listener->listening(), "listener should bind");
                     require(status.ok(), "probe should succeed once the port listens");
                     const auto lag =
                         std::chrono::duration_cast<std::chrono::milliseconds>(finished_at - bound_at).count();
                     require(lag < 50 + 200, "probe should notice within about one interval");
                   }});

  tests.push_back({"zip_archive_reads_stored_and_deflated_entries", [] {
                     const std::string text(10000, 'a');
                     const auto bytes = wiredrive::testing::make_zip(
                         {{.name = "plain.txt", .content = "hello", .deflate = false},
                          {.name = "dir/", .content = "", .deflate = false},
                          {.name = "dir/packed.txt", .content = text},
                          {.name = "empty.txt", .content = ""}});
                     auto archive = driver::ZipArchive::from_bytes(bytes);
                     require(archive.ok(), archive.ok() ? "" : archive.error().message);
                     require(archive.value().entries().size() == 4, "four entries expected");

                     const auto *plain = archive.value().find("plain.txt");
                     require(plain != nullptr && plain->method == 0, "stored entry expected");
                     require(archive.value().read(*plain).value() == "hello", "stored content mismatch");

                     const auto *packed = archive.value().find("dir/packed.txt");
                     require(packed != nullptr && packed->method == 8, "deflated entry expected");
                     require(packed->compressed_size < packed->uncompressed_size, "should be compressed");
                     require(archive.value().read(*packed).value() == text, "inflated content mismatch");

                     const auto *empty = archive.value().find("empty.txt");
                     require(empty != nullptr && archive.value().read(*empty).value().empty(),
                             "empty entry should read as empty");
                     require(archive.value().find("dir/")->is_directory(), "directory entry expected");
                   }});

  tests.push_back({"zip_archive_detects_corruption", [] {
                     auto bytes = wiredrive::testing::make_zip(
                         {{.name = "plain.txt", .content = "hello world", .deflate = false}});
                     const auto at = bytes.find("hello world");
                     bytes[at] = 'j';
                     auto archive = driver::ZipArchive::from_bytes(bytes);
                     require(archive.ok(), "directory should still parse");
                     const auto content = archive.value().read(archive.value().entries().front());
                     require(!content.ok(), "crc mismatch should fail");
                     require(content.error().message.find("crc mismatch") != std::string::npos,
                             "message should mention crc");

                     const auto garbage = driver::ZipArchive::from_bytes("definitely not a zip file at all");
                     require(!garbage.ok(), "garbage should fail");
                     require(garbage.error().message.find("malformed extension archive") == 0,
                             "malformed prefix expected");
                   }});

  tests.push_back({"zip_archive_rejects_oversized_entry", [] {
                     const auto original = wiredrive::testing::make_zip(
                         {{.name = "install.rdf", .content = "hello"}});

                     auto huge = original;
                     set_declared_size(huge, 0xFFFFFFF0U);
                     auto archive = driver::ZipArchive::from_bytes(huge);
                     require(archive.ok(), archive.ok() ? "" : archive.error().message);
                     const auto &entry = archive.value().entries().front();
                     require(entry.uncompressed_size == 0xFFFFFFF0U, "declared size should be read");
                     const auto content = archive.value().read(entry);
                     require(!content.ok(), "oversized entry should fail");
                     require(content.error().kind == common::ErrorKind::Config, "config error expected");
                     require(content.error().message.find("over the entry size limit") != std::string::npos,
                             "message should name the limit: " + content.error().message);
                     const auto id = driver::read_extension_id(archive.value());
                     require(!id.ok() && id.error().kind == common::ErrorKind::Config,
                             "extension id lookup should surface the config error");

                     auto inflated = original;
                     set_declared_size(inflated, 1000);
                     auto padded = driver::ZipArchive::from_bytes(inflated);
                     require(padded.ok(), "archive should parse");
                     const auto short_read = padded.value().read(padded.value().entries().front());
                     require(!short_read.ok(), "short entry should fail");
                     require(short_read.error().message.find("size mismatch for install.rdf") != std::string::npos,
                             "message should report the size mismatch: " + short_read.error().message);
                   }});

  tests.push_back({"zip_archive_rejects_escaping_entries", [] {
                     const TempWorkspace workspace;
                     const auto bytes = wiredrive::testing::make_zip(
                         {{.name = "ok.txt", .content = "fine"}, {.name = "../evil.txt", .content = "bad"}});
                     auto archive = driver::ZipArchive::from_bytes(bytes);
                     require(archive.ok(), "archive should parse");
                     const auto dest = workspace.path() / "out";
                     const auto status = archive.value().extract_all(dest);
                     require(!status.ok(), "escaping entry should be rejected");
                     require(!std::filesystem::exists(dest / "ok.txt"), "nothing should be written");
                     require(!std::filesystem::exists(workspace.path() / "evil.txt"), "no escape");

                     require(driver::is_safe_entry_name("a/b/c.txt"), "relative name is safe");
                     require(!driver::is_safe_entry_name("/etc/passwd"), "absolute name is unsafe");
                     require(!driver::is_safe_entry_name("a/../../b"), "dot-dot is unsafe");
                     require(!driver::is_safe_entry_name("C:\\x"), "drive prefix is unsafe");
                     require(driver::is_safe_entry_name("a..b/c"), "dots inside a name are fine");
                   }});

  tests.push_back({"user_prefs_round_trip_one_line_per_entry", [] {
                     cfg::Preferences prefs;
                     prefs["app.update.enabled"] = false;
                     prefs["browser.startup.page"] = std::int64_t{0};
                     prefs["dom.max_script_run_time"] = std::int64_t{-30};
                     prefs["browser.startup.homepage"] = std::string("about:blank");
                     prefs["general.useragent.override"] = std::string("agent \"quoted\" \\ back");
                     prefs["webdriver_firefox_port"] = std::int64_t{7055};

                     const auto rendered = driver::render_user_prefs(prefs);
                     require(rendered.ok(), "render should succeed");
                     require(count_lines(rendered.value()) == prefs.size(), "one line per preference");

                     const auto parsed = driver::parse_user_prefs(rendered.value());
                     require(parsed.ok(), parsed.ok() ? "" : parsed.error().message);
                     require(parsed.value() == prefs, "round trip should preserve every value");
                   }});

  tests.push_back({"user_prefs_reject_unsupported_types", [] {
                     cfg::Preferences prefs;
                     prefs["layout.css.devPixelsPerPx"] = 1.5;
                     const auto rendered = driver::render_user_prefs(prefs);
                     require(!rendered.ok(), "double should be rejected");
                     require(rendered.error().kind == common::ErrorKind::Config, "config error expected");
                     require(rendered.error().message ==
                                 "unexpected preference type float: layout.css.devPixelsPerPx",
                             "message mismatch: " + rendered.error().message);
                   }});

  tests.push_back({"extension_id_from_manifests", [] {
                     require(driver::parse_install_rdf_id(wiredrive::testing::install_rdf("fxdriver@googlecode.com"))
                                     .value_or("") == "fxdriver@googlecode.com",
                             "child element id expected");
                     require(driver::parse_install_rdf_id(
                                 R"(<RDF><Description em:id="attr@example.com" about="x"/></RDF>)")
                                     .value_or("") == "attr@example.com",
                             "attribute id expected");
                     require(!driver::parse_install_rdf_id("<RDF><Other/></RDF>").has_value(),
                             "no description means no id");
                     require(driver::parse_install_rdf_id(
                                 R"(<RDF xmlns:em="http://www.mozilla.org/2004/em-rdf#">)"
                                 R"(<Description><em:id><![CDATA[a&b@example.com]]></em:id></Description></RDF>)")
                                     .value_or("") == "a&b@example.com",
                             "cdata id expected");
                     require(driver::parse_install_rdf_id(
                                 R"(<RDF xmlns:em="http://www.mozilla.org/2004/em-rdf#">)"
                                 R"(<Description em:id="x&#64;example.com&#x21;"/></RDF>)")
                                     .value_or("") == "x@example.com!",
                             "character references should be decoded");
                     require(driver::parse_install_rdf_id(
                                 R"(<RDF><Other><Description em:id="nested@example.com"/></Other></RDF>)")
                                     .value_or("") == "",
                             "only top-level descriptions count");
                     require(!driver::parse_install_rdf_id("<RDF><Description>").has_value(),
                             "unterminated document has no id");
                     require(driver::parse_manifest_json_id(
                                 R"({"browser_specific_settings":{"gecko":{"id":"we@example.com"}}})")
                                     .value_or("") == "we@example.com",
                             "manifest id expected");
                     require(driver::parse_manifest_json_id(R"({"applications":{"gecko":{"id":"old@example.com"}}})")
                                     .value_or("") == "old@example.com",
                             "legacy manifest id expected");
                   }});

  tests.push_back({"profile_builder_lays_out_extension_and_prefs", [] {
                     const TempWorkspace workspace;
                     const auto archive =
                         wiredrive::testing::write_extension_archive(workspace, "fxdriver@googlecode.com");
                     cfg::Preferences prefs;
                     prefs["webdriver_firefox_port"] = std::int64_t{7056};
                     driver::set_log_directory(prefs, workspace.path() / "logs");
                     require(prefs.size() == 5, "log directory should add four preferences");

                     const auto root = workspace.path() / "profiles";
                     std::filesystem::create_directories(root);
                     const auto profile = driver::ProfileBuilder(archive, prefs, root).build();
                     require(profile.ok(), profile.ok() ? "" : profile.error().message);
                     const auto &dir = profile.value().directory;
                     require(dir.parent_path() == root, "profile should live under the temp root");
                     require(profile.value().extension_id == "fxdriver@googlecode.com", "id mismatch");

                     const auto ext = dir / "extensions" / "fxdriver@googlecode.com";
                     require(std::filesystem::exists(ext / "install.rdf"), "install.rdf missing");
                     require(std::filesystem::exists(ext / "chrome" / "driver.js"), "payload missing");

                     const auto user_js = common::read_file(dir / "user.js");
                     require(user_js.ok(), "user.js should exist");
                     require(user_js.value().find("user_pref(\"webdriver_firefox_port\", 7056);") !=
                                 std::string::npos,
                             "port preference missing");
                     const auto perms = std::filesystem::status(dir / "user.js").permissions();
                     require((perms & std::filesystem::perms::others_read) == std::filesystem::perms::none,
                             "user.js should not be world readable");
                   }});

  tests.push_back({"profile_builder_cleans_up_on_failure", [] {
                     const TempWorkspace workspace;
                     const auto root = workspace.path() / "profiles";
                     std::filesystem::create_directories(root);

                     const auto missing =
                         driver::ProfileBuilder(workspace.path() / "missing.xpi", {}, root).build();
                     require(!missing.ok(), "missing archive should fail");
                     require(missing.error().message.find("create profile failed: ") == 0,
                             "stage prefix expected: " + missing.error().message);
                     require(std::filesystem::is_empty(root), "no profile directory should remain");

                     const auto no_manifest = workspace.create_file(
                         "bare.xpi", wiredrive::testing::make_zip({{.name = "readme.txt", .content = "x"}}));
                     const auto bare = driver::ProfileBuilder(no_manifest, {}, root).build();
                     require(!bare.ok(), "archive without manifest should fail");
                     require(bare.error().kind == common::ErrorKind::Config, "config error expected");
                     require(std::filesystem::is_empty(root), "no profile directory should remain");
                   }});
}
