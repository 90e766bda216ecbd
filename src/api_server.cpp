#include "blackjack/advisor.hpp"
#include "blackjack/errors.hpp"
#include "blackjack/wire.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>

namespace {

volatile std::sig_atomic_t g_stop = 0;

void on_sigint(int) {
    g_stop = 1;
}

struct HttpRequest {
    std::string method;
    std::string path;
    std::map<std::string, std::string> headers;
    std::string body;
};

struct HttpResponse {
    int status = 200;
    std::string body;
};

struct ServerOptions {
    int port = 8080;
    blackjack::TableRules rules;
    blackjack::SimulationConfig sim;
};

std::string trim(const std::string& s) {
    const auto is_space = [](char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; };
    std::size_t b = 0;
    std::size_t e = s.size();
    while (b < e && is_space(s[b])) {
        ++b;
    }
    while (e > b && is_space(s[e - 1])) {
        --e;
    }
    return s.substr(b, e - b);
}

std::string status_text(int code) {
    switch (code) {
        case 200:
            return "OK";
        case 204:
            return "No Content";
        case 400:
            return "Bad Request";
        case 404:
            return "Not Found";
        case 409:
            return "Conflict";
        default:
            return "Internal Server Error";
    }
}

bool send_all(int fd, const std::string& data) {
    std::size_t sent = 0;
    while (sent < data.size()) {
        const ssize_t n = ::send(fd, data.data() + sent, data.size() - sent, 0);
        if (n <= 0) {
            return false;
        }
        sent += static_cast<std::size_t>(n);
    }
    return true;
}

void send_response(int fd, const HttpResponse& resp) {
    std::ostringstream os;
    os << "HTTP/1.1 " << resp.status << ' ' << status_text(resp.status) << "\r\n";
    if (!resp.body.empty()) {
        os << "Content-Type: application/json\r\n";
    }
    os << "Access-Control-Allow-Origin: *\r\n";
    os << "Access-Control-Allow-Methods: GET, POST, OPTIONS\r\n";
    os << "Access-Control-Allow-Headers: Content-Type\r\n";
    os << "Connection: close\r\n";
    os << "Content-Length: " << resp.body.size() << "\r\n\r\n";
    os << resp.body;
    if (!send_all(fd, os.str())) {
        std::cerr << "send failed: " << std::strerror(errno) << "\n";
    }
}

bool read_request(int fd, HttpRequest& req) {
    constexpr std::size_t kMaxRequestSize = 1 << 16;
    std::string buffer;
    char tmp[4096];

    std::size_t header_end = std::string::npos;
    while (header_end == std::string::npos) {
        const ssize_t n = ::recv(fd, tmp, sizeof(tmp), 0);
        if (n <= 0) {
            return false;
        }
        buffer.append(tmp, static_cast<std::size_t>(n));
        if (buffer.size() > kMaxRequestSize) {
            return false;
        }
        header_end = buffer.find("\r\n\r\n");
    }

    std::istringstream hs(buffer.substr(0, header_end));
    std::string line;
    if (!std::getline(hs, line)) {
        return false;
    }
    std::istringstream rl(trim(line));
    std::string version;
    if (!(rl >> req.method >> req.path >> version)) {
        return false;
    }

    while (std::getline(hs, line)) {
        const auto colon = line.find(':');
        if (colon != std::string::npos) {
            req.headers[trim(line.substr(0, colon))] = trim(line.substr(colon + 1));
        }
    }

    std::size_t content_length = 0;
    const auto it = req.headers.find("Content-Length");
    if (it != req.headers.end()) {
        content_length = static_cast<std::size_t>(std::strtoul(it->second.c_str(), nullptr, 10));
    }
    if (content_length > kMaxRequestSize) {
        return false;
    }

    req.body = buffer.substr(header_end + 4);
    while (req.body.size() < content_length) {
        const ssize_t n = ::recv(fd, tmp, sizeof(tmp), 0);
        if (n <= 0) {
            return false;
        }
        req.body.append(tmp, static_cast<std::size_t>(n));
    }
    req.body.resize(content_length);
    return true;
}

std::string require_string(const std::string& body, const std::string& key) {
    const auto v = blackjack::wire::find_string_field(body, key);
    if (!v) {
        throw std::invalid_argument("missing field: " + key);
    }
    return *v;
}

int require_int(const std::string& body, const std::string& key) {
    const auto v = blackjack::wire::find_int_field(body, key);
    if (!v) {
        throw std::invalid_argument("missing or malformed integer field: " + key);
    }
    return *v;
}

HttpResponse route(blackjack::Advisor& advisor, const HttpRequest& req) {
    using blackjack::wire::find_bool_field;
    using blackjack::wire::find_int_field;

    if (req.method == "POST" && req.path == "/deal") {
        return {200, blackjack::wire::deal_to_json(advisor.deal_card(require_string(req.body, "card")))};
    }
    if (req.method == "POST" && req.path == "/restore") {
        return {200, blackjack::wire::deal_to_json(advisor.restore_card(require_string(req.body, "card")))};
    }
    if (req.method == "GET" && req.path == "/status") {
        return {200, blackjack::wire::status_to_json(advisor.get_status())};
    }
    if (req.method == "GET" && req.path == "/betting") {
        return {200, blackjack::wire::betting_to_json(advisor.betting_recommendation())};
    }
    if (req.method == "POST" && req.path == "/reset") {
        const auto decks = find_int_field(req.body, "decks");
        if (decks) {
            advisor.reset_shoe(*decks);
        } else {
            advisor.reset_shoe();
        }
        return {200, blackjack::wire::status_to_json(advisor.get_status())};
    }
    if (req.method == "POST" && (req.path == "/evaluate" || req.path == "/recommend")) {
        const int total = require_int(req.body, "player_total");
        const std::string upcard = require_string(req.body, "dealer_upcard");
        const bool soft = find_bool_field(req.body, "is_soft").value_or(false);
        const bool pair = find_bool_field(req.body, "is_pair").value_or(false);

        if (req.path == "/recommend") {
            const blackjack::Action a = advisor.move_recommendation(total, upcard, soft, pair);
            return {200, "{\"Best\":\"" + blackjack::to_string(a) + "\"}"};
        }

        const int trials = find_int_field(req.body, "trials").value_or(advisor.simulator().config().trials_per_action);
        const blackjack::Evaluation e = advisor.evaluate(total, upcard, soft, pair, trials);
        if (e.aborted_trials() > 0) {
            std::cerr << "warning: " << e.aborted_trials() << " trials aborted (deck exhausted)\n";
        }
        return {200, blackjack::wire::evaluation_to_json(e)};
    }
    if (req.method == "GET" && req.path == "/health") {
        return {200, "{\"ok\":true}"};
    }
    return {404, blackjack::wire::error_to_json("not found")};
}

HttpResponse handle(blackjack::Advisor& advisor, const HttpRequest& req) {
    if (req.method == "OPTIONS") {
        return {204, ""};
    }
    try {
        return route(advisor, req);
    } catch (const blackjack::ShoeExhausted& e) {
        return {409, blackjack::wire::error_to_json(e.what())};
    } catch (const blackjack::CardNotDealt& e) {
        return {409, blackjack::wire::error_to_json(e.what())};
    } catch (const blackjack::DeckExhausted& e) {
        std::cerr << "simulation failed: " << e.what() << "\n";
        return {500, blackjack::wire::error_to_json(e.what())};
    } catch (const std::invalid_argument& e) {
        return {400, blackjack::wire::error_to_json(e.what())};
    } catch (const std::exception& e) {
        std::cerr << "request failed: " << e.what() << "\n";
        return {500, blackjack::wire::error_to_json(e.what())};
    }
}

bool parse_options(int argc, char** argv, ServerOptions& opt) {
    for (int i = 1; i < argc; ++i) {
        const std::string flag = argv[i];
        if (flag == "--h17") {
            opt.rules.dealer_hits_soft_17 = true;
            continue;
        }
        if (i + 1 >= argc) {
            return false;
        }
        char* end = nullptr;
        errno = 0;
        const long long v = std::strtoll(argv[++i], &end, 10);
        if (errno != 0 || *end != '\0' || v < 1) {
            return false;
        }
        if (flag == "--port" && v <= 65535) {
            opt.port = static_cast<int>(v);
        } else if (flag == "--decks" && v <= blackjack::kMaxDecks) {
            opt.rules.num_decks = static_cast<int>(v);
        } else if (flag == "--trials" && v <= 100000000) {
            opt.sim.trials_per_action = static_cast<int>(v);
        } else if (flag == "--seed") {
            opt.sim.seed = static_cast<std::uint64_t>(v);
        } else if (flag == "--threads" && v <= 256) {
            opt.sim.worker_threads = static_cast<int>(v);
        } else {
            return false;
        }
    }
    return true;
}

} // namespace

int main(int argc, char** argv) {
    ServerOptions opt;
    if (!parse_options(argc, argv, opt)) {
        std::cerr << "usage: " << argv[0]
                  << " [--port N] [--decks N] [--trials N] [--seed N] [--threads N] [--h17]\n";
        return 2;
    }

    std::signal(SIGINT, on_sigint);
    blackjack::Advisor advisor(opt.rules, opt.sim);

    const int server_fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (server_fd < 0) {
        std::cerr << "socket failed: " << std::strerror(errno) << "\n";
        return 1;
    }

    int reuse = 1;
    if (::setsockopt(server_fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0) {
        std::cerr << "setsockopt failed: " << std::strerror(errno) << "\n";
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    addr.sin_port = htons(static_cast<std::uint16_t>(opt.port));

    if (::bind(server_fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::cerr << "bind failed: " << std::strerror(errno) << "\n";
        ::close(server_fd);
        return 1;
    }
    if (::listen(server_fd, 16) < 0) {
        std::cerr << "listen failed: " << std::strerror(errno) << "\n";
        ::close(server_fd);
        return 1;
    }

    std::cout << "Blackjack advisor listening on http://localhost:" << opt.port
              << " (" << blackjack::describe(opt.rules) << ")\n";
    while (!g_stop) {
        sockaddr_in client_addr{};
        socklen_t client_len = sizeof(client_addr);
        const int client_fd = ::accept(server_fd, reinterpret_cast<sockaddr*>(&client_addr), &client_len);
        if (client_fd < 0) {
            if (errno == EINTR) {
                continue;
            }
            std::cerr << "accept failed: " << std::strerror(errno) << "\n";
            break;
        }

        HttpRequest req;
        if (!read_request(client_fd, req)) {
            send_response(client_fd, {400, blackjack::wire::error_to_json("invalid request")});
        } else {
            send_response(client_fd, handle(advisor, req));
        }
        ::close(client_fd);
    }

    ::close(server_fd);
    return 0;
}
