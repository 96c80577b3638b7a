#include "executor.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "session.hpp"
#include "worker_pool.hpp"
#include <iostream>
#include <fstream>
#include <sstream>
#include <cstring>
#include <cstdio>
#include <getopt.h>
#include <chrono>
#include <atomic>
#include <vector>
#include <mutex>

// Define our Color Palette
#define RESET   "\033[0m"
#define CYAN    "\033[36m"
#define GREY    "\033[38;5;244m"
#define PINK    "\033[38;5;205m"
#define RED     "\033[31m"
#define YELLOW  "\033[33m"
#define GREEN   "\033[92m"

using namespace volley;

// ─────────────────────────────────────────────────────────────────────────────
// Smart size formatter  e.g. 102400 → "100.00KB"
// ─────────────────────────────────────────────────────────────────────────────
static std::string fmt_size(size_t bytes) {
    char buf[32];
    if (bytes < 1024) {
        snprintf(buf, sizeof(buf), "%zuB", bytes);
    } else if (bytes < 1024*1024) {
        snprintf(buf, sizeof(buf), "%.2fKB", bytes/1024.0);
    } else if (bytes < (size_t)1024*1024*1024) {
        snprintf(buf, sizeof(buf), "%.2fMB", bytes/(1024.0*1024.0));
    } else {
        snprintf(buf, sizeof(buf), "%.2fGB", bytes/(1024.0*1024.0*1024.0));
    }
    return buf;
}

static std::string json_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 2);
    for (unsigned char c : s) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c < 0x20) {
                    char esc[8];
                    snprintf(esc, sizeof(esc), "\\u%04x", c);
                    out += esc;
                } else {
                    out += static_cast<char>(c);
                }
        }
    }
    return out;
}

void print_usage(const char* prog_name) {
    std::cout << "\n";
    std::cout << GREY << "╭───────────────────────────────────────────────────────────────╮\n";
    std::cout << "│" << RESET << "              Volley - Concurrent HTTP Requests                " << GREY << "│\n";
    std::cout << "├───────────────────────────────────────────────────────────────┤\n";
    std::cout << "│" << RESET << "            Usage: " << prog_name << " [options] <URL>...\n";
    std::cout << GREY << "├───────────────────────────────────────────────────────────────┤\n";
    std::cout << "│  " << RESET << "REQUEST OPTIONS" << GREY << "                                              │\n";
    std::cout << "│  " << GREEN << "-X, --request <method>    " << PINK << "HTTP method (GET, POST, etc.)      " << GREY << "│\n";
    std::cout << "│  " << GREEN << "-H, --header <header>     " << PINK << "Add custom header (repeatable)     " << GREY << "│\n";
    std::cout << "│  " << GREEN << "-d, --data <data>         " << PINK << "Request body (implies POST)        " << GREY << "│\n";
    std::cout << "│  " << GREEN << "-m, --max-time <sec>      " << PINK << "Request timeout (default: 30)      " << GREY << "│\n";
    std::cout << "│  " << GREEN << "-L, --location            " << PINK << "Follow redirects (default: on)     " << GREY << "│\n";
    std::cout << "│  " << GREEN << "    --no-location         " << PINK << "Do not follow redirects            " << GREY << "│\n";
    std::cout << "│  " << GREEN << "-k, --insecure            " << PINK << "Skip certificate verification      " << GREY << "│\n";
    std::cout << "│  " << GREEN << "-A, --user-agent <ua>     " << PINK << "Custom User-Agent string           " << GREY << "│\n";
    std::cout << "│  " << GREEN << "-C, --no-compress         " << PINK << "Disable compression                " << GREY << "│\n";
    std::cout << "├───────────────────────────────────────────────────────────────┤\n";
    std::cout << "│  " << RESET << "EXECUTION" << GREY << "                                                    │\n";
    std::cout << "│  " << GREEN << "-B, --batch <file>        " << PINK << "Read URLs from file                " << GREY << "│\n";
    std::cout << "│  " << GREEN << "-P, --parallel <num>      " << PINK << "Worker threads (default: cores)    " << GREY << "│\n";
    std::cout << "│  " << GREEN << "-U, --unordered           " << PINK << "Print in completion order          " << GREY << "│\n";
    std::cout << "├───────────────────────────────────────────────────────────────┤\n";
    std::cout << "│  " << RESET << "OUTPUT" << GREY << "                                                       │\n";
    std::cout << "│  " << GREEN << "-i, --include             " << PINK << "Include headers in output          " << GREY << "│\n";
    std::cout << "│  " << GREEN << "-J, --json                " << PINK << "One JSON object per response       " << GREY << "│\n";
    std::cout << "│  " << GREEN << "-v, --verbose             " << PINK << "Verbose output (-vv for debug)     " << GREY << "│\n";
    std::cout << "├───────────────────────────────────────────────────────────────┤\n";
    std::cout << "│  " << RESET << "EXAMPLES" << GREY << "                                                     │\n";
    std::cout << "│  " << PINK << "└─ volley https://example.com                                " << GREY << "│\n";
    std::cout << "│  " << PINK << "└─ volley -P 8 -J https://a.example https://b.example        " << GREY << "│\n";
    std::cout << "│  " << PINK << "└─ volley -B urls.txt -P 20 -U -v                            " << GREY << "│\n";
    std::cout << "╰───────────────────────────────────────────────────────────────╯\n";
    std::cout << RESET << "\n";
}

void output_json(const Response& resp) {
    std::cout << "{\"url\": \"" << json_escape(resp.url) << "\"";
    std::cout << ", \"status\": " << resp.status_code;
    std::cout << ", \"reason\": \"" << json_escape(resp.reason) << "\"";
    std::cout << ", \"elapsed_ms\": " << resp.elapsed.count();
    std::cout << ", \"compressed\": " << (resp.was_compressed ? "true" : "false");
    std::cout << ", \"redirects\": " << resp.history.size();
    std::cout << ", \"headers\": {";
    bool first = true;
    resp.headers.for_each([&](const std::string& key, const std::string& value) {
        if (!first) std::cout << ", ";
        std::cout << "\"" << json_escape(key) << "\": \"" << json_escape(value) << "\"";
        first = false;
    });
    std::cout << "}, \"body_length\": " << resp.content().size() << "}\n";
}

void output_summary(const Response& resp) {
    const char* color = resp.ok() ? GREEN : (resp.status_code < 500 ? YELLOW : RED);
    std::cout << color << resp.status_code << RESET << " " << resp.reason << " "
              << CYAN << resp.url << RESET << GREY << " (" << fmt_size(resp.content().size())
              << ", " << resp.elapsed.count() << " ms)" << RESET << "\n";
}

void output_full(const Response& resp, bool include_headers) {
    if (include_headers) {
        std::cout << "HTTP/1.1 " << resp.status_code << " " << resp.reason << "\n";
        resp.headers.for_each([](const std::string& key, const std::string& value) {
            std::cout << key << ": " << value << "\n";
        });
        std::cout << "\n";
    }
    const auto& body = resp.content();
    std::cout.write(reinterpret_cast<const char*>(body.data()), body.size());
}

int main(int argc, char* argv[]) {
    std::string method = "GET";
    std::string data;
    std::string user_agent;
    std::string batch_file;
    bool include_headers = false;
    int verbosity = 0;
    bool follow_redirects = true;
    bool insecure = false;
    bool no_compress = false;
    bool json_output = false;
    bool unordered = false;
    int max_time = 30;
    int parallel = 0;
    Headers headers;

    static struct option long_options[] = {
        {"request", required_argument, 0, 'X'},
        {"header", required_argument, 0, 'H'},
        {"data", required_argument, 0, 'd'},
        {"include", no_argument, 0, 'i'},
        {"verbose", no_argument, 0, 'v'},
        {"location", no_argument, 0, 'L'},
        {"no-location", no_argument, 0, 1000},
        {"max-time", required_argument, 0, 'm'},
        {"insecure", no_argument, 0, 'k'},
        {"user-agent", required_argument, 0, 'A'},
        {"no-compress", no_argument, 0, 'C'},
        {"batch", required_argument, 0, 'B'},
        {"parallel", required_argument, 0, 'P'},
        {"unordered", no_argument, 0, 'U'},
        {"json", no_argument, 0, 'J'},
        {"help", no_argument, 0, 'h'},
        {0, 0, 0, 0}
    };

    int opt;
    while ((opt = getopt_long(argc, argv, "X:H:d:ivLm:kA:CB:P:UJh", long_options, nullptr)) != -1) {
        switch (opt) {
            case 'X': method = optarg; break;
            case 'H': {
                std::string header_str(optarg);
                size_t colon = header_str.find(':');
                if (colon != std::string::npos) {
                    std::string key = header_str.substr(0, colon);
                    std::string value = header_str.substr(colon + 1);
                    value.erase(0, value.find_first_not_of(" \t"));
                    headers.set(key, value);
                }
                break;
            }
            case 'd':
                data = optarg;
                if (method == "GET") method = "POST";
                break;
            case 'i': include_headers = true; break;
            case 'v': verbosity++; break;
            case 'L': follow_redirects = true; break;
            case 1000: follow_redirects = false; break;
            case 'm': max_time = std::atoi(optarg); break;
            case 'k': insecure = true; break;
            case 'A': user_agent = optarg; break;
            case 'C': no_compress = true; break;
            case 'B': batch_file = optarg; break;
            case 'P': parallel = std::atoi(optarg); break;
            case 'U': unordered = true; break;
            case 'J': json_output = true; break;
            case 'h':
                print_usage(argv[0]);
                return 0;
            default:
                print_usage(argv[0]);
                return 1;
        }
    }

    if (verbosity >= 2) {
        set_log_level(LogLevel::Debug);
    } else if (verbosity == 1) {
        set_log_level(LogLevel::Info);
    }

    std::vector<std::string> urls;
    if (!batch_file.empty()) {
        std::ifstream file(batch_file);
        if (!file) {
            std::cerr << "Error: Cannot open batch file: " << batch_file << "\n";
            return 1;
        }
        std::string line;
        while (std::getline(file, line)) {
            line.erase(0, line.find_first_not_of(" \t"));
            line.erase(line.find_last_not_of(" \t\r") + 1);
            if (line.empty() || line[0] == '#') continue;
            urls.push_back(line);
        }
    }
    for (int i = optind; i < argc; ++i) {
        urls.push_back(argv[i]);
    }

    if (urls.empty()) {
        std::cerr << "Error: URL required\n";
        print_usage(argv[0]);
        return 1;
    }

    // One session for every request so connections are reused
    SessionConfig config;
    if (!user_agent.empty()) {
        config.user_agent = user_agent;
    }
    config.timeout = std::chrono::seconds(max_time > 0 ? max_time : 30);
    config.compression = !no_compress;
    config.verify = !insecure;
    auto session = std::make_shared<Session>(config);

    RequestOptions options;
    options.allow_redirects = follow_redirects;
    if (!headers.empty()) {
        options.headers = headers;
    }
    if (!data.empty()) {
        options.data = data;
        if (!headers.contains("Content-Type")) {
            Headers with_type = headers;
            with_type.set("Content-Type", "application/x-www-form-urlencoded");
            options.headers = with_type;
        }
    }

    std::vector<AsyncRequest> requests;
    requests.reserve(urls.size());
    for (const auto& url : urls) {
        requests.push_back(volley::request(method, url, options, session));
    }

    std::atomic<size_t> failures{0};
    std::mutex err_mutex;
    ExceptionHandler report = [&](const AsyncRequest& req, std::exception_ptr error) {
        failures++;
        std::lock_guard<std::mutex> lock(err_mutex);
        std::cerr << RED << "Error: " << RESET << req.method() << " " << req.url()
                  << ": " << describe(error) << "\n";
    };

    size_t workers = parallel > 0 ? static_cast<size_t>(parallel) : WorkerPool::default_size();
    log_info() << "Processing " << urls.size() << " URLs with " << workers << " workers"
               << (unordered ? " (unordered)" : "");

    bool single = urls.size() == 1;
    size_t not_ok = 0;
    size_t received = 0;
    auto emit = [&](const Response& resp) {
        received++;
        if (!resp.ok()) not_ok++;
        if (json_output) {
            output_json(resp);
        } else if (single) {
            output_full(resp, include_headers);
        } else {
            output_summary(resp);
        }
    };

    auto start = std::chrono::steady_clock::now();
    try {
        if (unordered) {
            for (auto& resp : volley::imap(std::move(requests), false, workers, report)) {
                emit(resp);
            }
        } else {
            for (const auto& resp : volley::map(std::move(requests), false, workers, report)) {
                emit(resp);
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    auto elapsed = std::chrono::steady_clock::now() - start;

    auto total_ms = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
    log_info() << "Completed in " << total_ms << " ms";
    log_info() << "Success: " << (received - not_ok) << "/" << urls.size();

    return (failures == 0 && not_ok == 0) ? 0 : 1;
}
