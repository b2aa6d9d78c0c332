#include "tests/helpers/test_helpers.hpp"

#include <cstdlib>
#include <fstream>
#include <random>
#include <sstream>
#include <stdexcept>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <zip.h>

namespace wiredrive::testing {

TempWorkspace::TempWorkspace() {
  static std::mt19937_64 rng{std::random_device{}()};
  path_ = std::filesystem::temp_directory_path() /
          ("wiredrive-test-workspace-" + std::to_string(rng()));
  std::filesystem::create_directories(path_);
}

TempWorkspace::~TempWorkspace() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
}

std::filesystem::path TempWorkspace::create_file(const std::string &name,
                                                 const std::string &content) const {
  const auto file_path = path_ / name;
  std::error_code ec;
  std::filesystem::create_directories(file_path.parent_path(), ec);
  std::ofstream out(file_path, std::ios::trunc | std::ios::binary);
  out << content;
  return file_path;
}

std::filesystem::path TempWorkspace::create_script(const std::string &name,
                                                   const std::string &body) const {
  const auto script = create_file(name, "#!/bin/sh\n" + body);
  std::filesystem::permissions(script,
                               std::filesystem::perms::owner_all |
                                   std::filesystem::perms::group_read |
                                   std::filesystem::perms::group_exec,
                               std::filesystem::perm_options::replace);
  return script;
}

EnvGuard::EnvGuard(std::string key_, std::optional<std::string> value) : key(std::move(key_)) {
  if (const char *existing = std::getenv(key.c_str()); existing != nullptr) {
    old_value = existing;
  }
  if (value.has_value()) {
    setenv(key.c_str(), value->c_str(), 1);
  } else {
    unsetenv(key.c_str());
  }
}

EnvGuard::~EnvGuard() {
  if (old_value.has_value()) {
    setenv(key.c_str(), old_value->c_str(), 1);
  } else {
    unsetenv(key.c_str());
  }
}

void MockHttpClient::push_response(const std::uint16_t status, std::string body,
                                   protocol::HttpHeaders headers) {
  std::lock_guard<std::mutex> lock(mutex_);
  protocol::HttpResponse response;
  response.status = status;
  response.body = std::move(body);
  response.headers = std::move(headers);
  responses_.push_back(std::move(response));
}

void MockHttpClient::push_network_error(std::string message, const bool timeout) {
  std::lock_guard<std::mutex> lock(mutex_);
  protocol::HttpResponse response;
  response.network_error = true;
  response.network_error_message = std::move(message);
  response.timeout = timeout;
  responses_.push_back(std::move(response));
}

protocol::HttpResponse MockHttpClient::execute(const std::string &method, const std::string &url,
                                               const protocol::HttpHeaders &headers,
                                               const std::optional<std::string> &body,
                                               const std::uint64_t timeout_ms) {
  std::lock_guard<std::mutex> lock(mutex_);
  requests_.push_back(RecordedRequest{
      .method = method, .url = url, .headers = headers, .body = body, .timeout_ms = timeout_ms});
  if (responses_.empty()) {
    protocol::HttpResponse response;
    response.network_error = true;
    response.network_error_message = "no scripted response for " + method + " " + url;
    return response;
  }
  auto response = std::move(responses_.front());
  responses_.pop_front();
  return response;
}

std::vector<RecordedRequest> MockHttpClient::requests() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return requests_;
}

RecordedRequest MockHttpClient::last_request() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (requests_.empty()) {
    throw std::runtime_error("no request recorded");
  }
  return requests_.back();
}

std::size_t MockHttpClient::pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return responses_.size();
}

void RecordingObserver::record_event(const observability::ObserverEvent &event) {
  std::lock_guard<std::mutex> lock(mutex_);
  events_.push_back(event);
}

void RecordingObserver::record_metric(const observability::ObserverMetric &metric) {
  std::lock_guard<std::mutex> lock(mutex_);
  metrics_.push_back(metric);
}

std::vector<observability::ObserverEvent> RecordingObserver::events() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return events_;
}

std::vector<observability::ObserverMetric> RecordingObserver::metrics() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return metrics_;
}

TcpListener::TcpListener(const std::uint16_t port) {
  fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (fd_ < 0) {
    return;
  }
  const int reuse = 1;
  (void)setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  if (::bind(fd_, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0 ||
      ::listen(fd_, 16) != 0) {
    ::close(fd_);
    fd_ = -1;
    return;
  }

  socklen_t len = sizeof(addr);
  if (::getsockname(fd_, reinterpret_cast<sockaddr *>(&addr), &len) == 0) {
    port_ = ntohs(addr.sin_port);
  }
}

TcpListener::~TcpListener() {
  if (fd_ >= 0) {
    ::close(fd_);
  }
}

std::uint16_t unused_port() {
  const TcpListener probe;
  if (!probe.listening()) {
    throw std::runtime_error("unable to bind an ephemeral port");
  }
  return probe.port();
}

std::string make_zip(const std::vector<ZipFileSpec> &files) {
  const TempWorkspace scratch;
  const auto path = scratch.path() / "archive.zip";
  zipFile zip = zipOpen64(path.c_str(), APPEND_STATUS_CREATE);
  if (zip == nullptr) {
    throw std::runtime_error("zipOpen64 failed for " + path.string());
  }

  for (const auto &file : files) {
    const bool is_dir = !file.name.empty() && file.name.back() == '/';
    const bool deflated = file.deflate && !is_dir;
    zip_fileinfo info{};
    if (zipOpenNewFileInZip64(zip, file.name.c_str(), &info, nullptr, 0, nullptr, 0, nullptr,
                              deflated ? Z_DEFLATED : 0, deflated ? Z_BEST_COMPRESSION : 0,
                              0) != ZIP_OK) {
      zipClose(zip, nullptr);
      throw std::runtime_error("unable to add " + file.name);
    }
    if (!file.content.empty() &&
        zipWriteInFileInZip(zip, file.content.data(),
                            static_cast<unsigned>(file.content.size())) != ZIP_OK) {
      zipClose(zip, nullptr);
      throw std::runtime_error("unable to write " + file.name);
    }
    if (zipCloseFileInZip(zip) != ZIP_OK) {
      zipClose(zip, nullptr);
      throw std::runtime_error("unable to finish " + file.name);
    }
  }
  if (zipClose(zip, nullptr) != ZIP_OK) {
    throw std::runtime_error("zipClose failed for " + path.string());
  }

  std::ifstream in(path, std::ios::binary);
  std::stringstream bytes;
  bytes << in.rdbuf();
  return bytes.str();
}

std::string install_rdf(const std::string &id) {
  return R"(<?xml version="1.0"?>
<RDF xmlns="http://www.w3.org/1999/02/22-rdf-syntax-ns#"
     xmlns:em="http://www.mozilla.org/2004/em-rdf#">
  <Description about="urn:mozilla:install-manifest">
    <em:id>)" +
         id + R"(</em:id>
    <em:version>2.0</em:version>
    <em:targetApplication>
      <Description>
        <em:id>{ec8030f7-c20a-464f-9b0e-13a3a9e97384}</em:id>
      </Description>
    </em:targetApplication>
  </Description>
</RDF>
)";
}

std::filesystem::path write_extension_archive(const TempWorkspace &workspace,
                                              const std::string &id) {
  return workspace.create_file(
      "webdriver.xpi", make_zip({{.name = "install.rdf", .content = install_rdf(id)},
                                 {.name = "chrome/", .content = "", .deflate = false},
                                 {.name = "chrome/driver.js",
                                  .content = std::string(4096, 'x') + "\nvar port = 0;\n"},
                                 {.name = "chrome.manifest",
                                  .content = "content driver chrome/\n",
                                  .deflate = false}}));
}

config::DriverConfig fast_driver_config(const std::string &binary) {
  config::DriverConfig config;
  config.kind = config::StandaloneDriver{.log_path = "", .http_threads = 1, .url_base = ""};
  config.binary = binary;
  config.lock_timeout = std::chrono::milliseconds(2'000);
  config.start_timeout = std::chrono::milliseconds(3'000);
  config.probe_interval = std::chrono::milliseconds(50);
  config.lock_retry_interval = std::chrono::milliseconds(50);
  config.stop_grace = std::chrono::milliseconds(1'000);
  config.pump_join_timeout = std::chrono::milliseconds(500);
  return config;
}

} // namespace wiredrive::testing
