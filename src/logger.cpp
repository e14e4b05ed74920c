#include "logger.hpp"
#include <mutex>
#include <fstream>
#include <iostream>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <memory>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <system_error>

namespace {
std::mutex& log_mutex() {
    static std::mutex m;
    return m;
}

int& log_level_ref() {
    static int lvl = logger::Info;
    return lvl;
}

struct FileSink {
    std::string path;
    std::ofstream out;
    std::size_t max_bytes = 0;
    int backup_count = 0;
    std::size_t written = 0;
};

std::unique_ptr<FileSink>& file_sink_ref() {
    static std::unique_ptr<FileSink> f;
    return f;
}

// In-memory log buffer (ring)
std::vector<std::string>& log_buffer() {
    static std::vector<std::string> b;
    return b;
}
constexpr std::size_t kLogBufferMax = 2000; // keep last 2000 lines

std::string now_timestamp() {
    using namespace std::chrono;
    auto tp = system_clock::now();
    std::time_t tt = system_clock::to_time_t(tp);
    std::tm tm_buf{};
#if defined(_WIN32)
    localtime_s(&tm_buf, &tt);
#else
    localtime_r(&tt, &tm_buf);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

// name.log -> name.log.1 -> ... -> name.log.N (oldest dropped). Caller holds log_mutex.
void rotate(FileSink& sink) {
    namespace fs = std::filesystem;
    std::error_code ec;
    sink.out.close();
    if (sink.backup_count > 0) {
        fs::remove(sink.path + "." + std::to_string(sink.backup_count), ec);
        for (int i = sink.backup_count - 1; i >= 1; --i) {
            const std::string from = sink.path + "." + std::to_string(i);
            if (fs::exists(from, ec)) {
                fs::rename(from, sink.path + "." + std::to_string(i + 1), ec);
            }
        }
        fs::rename(sink.path, sink.path + ".1", ec);
        sink.out.open(sink.path, std::ios::app);
    } else {
        sink.out.open(sink.path, std::ios::trunc);
    }
    sink.written = 0;
}

void write_line(const char* level, const std::string& msg) {
    std::lock_guard<std::mutex> lock(log_mutex());
    const std::string ts = now_timestamp();
    std::ostringstream line;
    line << "[" << ts << "] " << level << " " << msg << '\n';
    const std::string text = line.str();

    // stdout
    if (level[1] == 'E') { // [ERROR]
        std::cerr << text << std::flush;
    } else {
        std::cout << text << std::flush;
    }

    // file (if enabled)
    if (auto& sink = file_sink_ref()) {
        if (sink->max_bytes > 0 && sink->written + text.size() > sink->max_bytes) {
            rotate(*sink);
        }
        if (sink->out.is_open()) {
            sink->out << text;
            sink->out.flush();
            sink->written += text.size();
        }
    }

    // In-memory ring buffer append
    auto& buf = log_buffer();
    buf.push_back(text);
    if (buf.size() > kLogBufferMax) {
        buf.erase(buf.begin(), buf.begin() + (buf.size() - kLogBufferMax));
    }
}
} // namespace

namespace logger {

void set_log_file(const std::string& path, std::size_t max_bytes, int backup_count) {
    std::lock_guard<std::mutex> lock(log_mutex());
    // Close previous
    if (auto& sink = file_sink_ref()) {
        if (sink->out.is_open()) {
            sink->out.flush();
            sink->out.close();
        }
        sink.reset();
    }
    if (path.empty()) return;

    std::error_code ec;
    const std::filesystem::path p(path);
    if (p.has_parent_path()) {
        std::filesystem::create_directories(p.parent_path(), ec);
    }

    auto sink = std::make_unique<FileSink>();
    sink->path = path;
    sink->max_bytes = max_bytes;
    sink->backup_count = std::max(0, backup_count);
    sink->out.open(path, std::ios::app);
    if (!sink->out.is_open()) {
        // fall back to console only
        return;
    }
    const auto size = std::filesystem::file_size(p, ec);
    sink->written = ec ? 0 : static_cast<std::size_t>(size);
    file_sink_ref() = std::move(sink);
}

void set_level(int lvl) {
    if (lvl < Debug) lvl = Debug;
    if (lvl > Error) lvl = Error;
    std::lock_guard<std::mutex> lock(log_mutex());
    log_level_ref() = lvl;
}

void set_level_name(const std::string& name) {
    std::string n = name;
    std::transform(n.begin(), n.end(), n.begin(), [](unsigned char c){ return (char)std::toupper(c); });
    if (n == "DEBUG") set_level(Debug);
    else if (n == "WARN" || n == "WARNING") set_level(Warn);
    else if (n == "ERROR" || n == "CRITICAL") set_level(Error);
    else set_level(Info);
}

int level() {
    std::lock_guard<std::mutex> lock(log_mutex());
    return log_level_ref();
}

void debug(const std::string& msg) {
    if (level() <= Debug) {
        write_line("[DEBUG]", msg);
    }
}

void info(const std::string& msg) {
    if (level() <= Info) {
        write_line("[INFO] ", msg);
    }
}

void warn(const std::string& msg) {
    if (level() <= Warn) {
        write_line("[WARN] ", msg);
    }
}

void error(const std::string& msg) {
    // Always print errors
    write_line("[ERROR]", msg);
}

// --- In-memory log buffer API ---
std::vector<std::string> lines() {
    std::lock_guard<std::mutex> lock(log_mutex());
    return log_buffer();
}

void clear() {
    std::lock_guard<std::mutex> lock(log_mutex());
    log_buffer().clear();
}

std::size_t line_count() {
    std::lock_guard<std::mutex> lock(log_mutex());
    return log_buffer().size();
}

} // namespace logger
