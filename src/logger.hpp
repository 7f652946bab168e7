#pragma once
#include <string>
#include <string_view>
#include <vector>
#include <memory>
#include <mutex>
#include <chrono>
#include <thread>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <atomic>
#include <optional>
#include <cctype>
#include <cstdint>
#include <type_traits>

#ifndef LOG_DEFAULT_LEVEL
#define LOG_DEFAULT_LEVEL 2   // Info
#endif

class Logger {
public:
    enum class Level : int { Trace=0, Debug=1, Info=2, Warn=3, Error=4, None=5 };

    struct Record {
        Level level;
        std::string msg;
        std::uint64_t seq;
        std::chrono::steady_clock::time_point tp;
        std::thread::id tid;
    };

    struct Sink {
        virtual ~Sink() = default;
        virtual void write(const Record& r) = 0;
    };

    static const char* levelName(Level l) {
        switch (l) {
            case Level::Trace: return "TRACE";
            case Level::Debug: return "DEBUG";
            case Level::Info:  return "INFO";
            case Level::Warn:  return "WARN";
            case Level::Error: return "ERROR";
            case Level::None:  return "NONE";
        }
        return "?";
    }

    // Case-insensitive; accepts the names above.
    static std::optional<Level> parseLevel(std::string_view s) {
        std::string up(s);
        for (auto& c : up) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        for (int i = 0; i <= static_cast<int>(Level::None); ++i) {
            auto l = static_cast<Level>(i);
            if (up == levelName(l)) return l;
        }
        if (up == "WARNING") return Level::Warn;
        return std::nullopt;
    }

    static std::string tagged(const Record& r) {
        std::string out;
        out.reserve(r.msg.size() + 8);
        out += '[';
        out += levelName(r.level);
        out += "] ";
        out += r.msg;
        return out;
    }

    class StdoutSink : public Sink {
    public:
        void write(const Record& r) override {
            std::string line = tagged(r);
            line += '\n';
            std::lock_guard<std::mutex> lk(m_);
            std::fwrite(line.data(), 1, line.size(), stdout);
        }
    private: std::mutex m_;
    };

    class FileSink : public Sink {
    public:
        explicit FileSink(const std::string& path) : f_(path, std::ios::app) {}
        bool good() const { return static_cast<bool>(f_); }
        void write(const Record& r) override {
            std::lock_guard<std::mutex> lk(m_);
            if (!f_) return;
            f_ << tagged(r) << '\n';
        }
    private:
        std::ofstream f_;
        std::mutex m_;
    };

    // Keeps the last `cap` messages; used by tests and post-mortem dumps.
    class RingBufferSink : public Sink {
    public:
        explicit RingBufferSink(std::size_t cap=1024) : cap_(cap ? cap : 1) {}
        void write(const Record& r) override {
            std::lock_guard<std::mutex> lk(m_);
            if (buf_.size() < cap_) buf_.push_back(r.msg);
            else {
                buf_[head_] = r.msg;
                head_ = (head_ + 1) % cap_;
            }
        }
        std::vector<std::string> snapshot() const {
            std::lock_guard<std::mutex> lk(m_);
            std::vector<std::string> out;
            out.reserve(buf_.size());
            for (std::size_t i=0;i<buf_.size();++i)
                out.push_back(buf_[(head_ + i) % buf_.size()]);
            return out;
        }
        bool contains(std::string_view needle) const {
            std::lock_guard<std::mutex> lk(m_);
            for (auto& m : buf_)
                if (m.find(needle) != std::string::npos) return true;
            return false;
        }
    private:
        std::size_t cap_;
        mutable std::mutex m_;
        std::vector<std::string> buf_;
        std::size_t head_ = 0;
    };

    explicit Logger(Level lvl = static_cast<Level>(LOG_DEFAULT_LEVEL))
        : level_(static_cast<int>(lvl)) {}

    void setLevel(Level l) { level_.store(static_cast<int>(l), std::memory_order_relaxed); }
    Level level() const { return static_cast<Level>(level_.load(std::memory_order_relaxed)); }

    void addSink(std::shared_ptr<Sink> s) {
        std::lock_guard<std::mutex> lk(sinkMutex_);
        sinks_.push_back(std::move(s));
    }

    bool willLog(Level l) const {
        return l != Level::None && static_cast<int>(l) >= static_cast<int>(level());
    }

    template<typename... Args>
    void log(Level l, std::string_view fmt, Args&&... args) {
#ifndef LOG_ENABLED
        (void)l; (void)fmt; (void)sizeof...(Args);
#else
        if (!willLog(l)) return;
        writeRecord(l, format(fmt, std::forward<Args>(args)...));
#endif
    }

    template<typename... A> void trace(std::string_view f, A&&... a){ log(Level::Trace,f,std::forward<A>(a)...);}
    template<typename... A> void debug(std::string_view f, A&&... a){ log(Level::Debug,f,std::forward<A>(a)...);}
    template<typename... A> void info (std::string_view f, A&&... a){ log(Level::Info ,f,std::forward<A>(a)...);}
    template<typename... A> void warn (std::string_view f, A&&... a){ log(Level::Warn ,f,std::forward<A>(a)...);}
    template<typename... A> void error(std::string_view f, A&&... a){ log(Level::Error,f,std::forward<A>(a)...);}

    // "{}" inserts the next argument, "{:.Nf}" inserts it with N fixed decimals.
    template<typename... Args>
    static std::string format(std::string_view fmt, Args&&... args) {
        if constexpr (sizeof...(Args) == 0) {
            return std::string(fmt);
        } else {
            using Printer = void(*)(std::ostream&, const void*);
            const void* ptrs[] = { static_cast<const void*>(&args)... };
            Printer printers[] = { &printOne<std::remove_reference_t<Args>>... };
            std::ostringstream oss;
            std::size_t ai=0;
            for (std::size_t i=0;i<fmt.size();++i) {
                if (fmt[i] != '{') { oss<<fmt[i]; continue; }
                std::size_t close = fmt.find('}', i);
                if (close == std::string_view::npos) { oss<<fmt.substr(i); break; }
                std::string_view spec = fmt.substr(i+1, close-i-1);
                if (ai < sizeof...(Args)) {
                    int prec = precisionOf(spec);
                    if (prec >= 0) {
                        auto flags = oss.flags();
                        auto oldPrec = oss.precision();
                        oss<<std::fixed<<std::setprecision(prec);
                        printers[ai](oss, ptrs[ai]);
                        oss.flags(flags);
                        oss.precision(oldPrec);
                    } else {
                        printers[ai](oss, ptrs[ai]);
                    }
                    ++ai;
                }
                i = close;
            }
            return oss.str();
        }
    }

private:
    template<typename T>
    static void printOne(std::ostream& o, const void* p) { o << *static_cast<const T*>(p); }

    // ":.3f" -> 3, anything else -> -1
    static int precisionOf(std::string_view spec) {
        if (spec.size() < 4 || spec[0] != ':' || spec[1] != '.' || spec.back() != 'f')
            return -1;
        int v = 0;
        for (std::size_t i = 2; i + 1 < spec.size(); ++i) {
            if (spec[i] < '0' || spec[i] > '9') return -1;
            v = v * 10 + (spec[i] - '0');
        }
        return v;
    }

    void writeRecord(Level l, std::string msg) {
        Record r{l,std::move(msg),
                 seq_.fetch_add(1,std::memory_order_relaxed),
                 std::chrono::steady_clock::now(),
                 std::this_thread::get_id()};
        std::lock_guard<std::mutex> lk(sinkMutex_);
        for (auto& s : sinks_) s->write(r);
    }

    std::atomic<int> level_;
    std::atomic<std::uint64_t> seq_{0};
    std::vector<std::shared_ptr<Sink>> sinks_;
    mutable std::mutex sinkMutex_;
};

#ifdef LOG_ENABLED
#define LOG_TRACE(L, ...) do{ if(L) (L)->trace(__VA_ARGS__); }while(0)
#define LOG_DEBUG(L, ...) do{ if(L) (L)->debug(__VA_ARGS__); }while(0)
#define LOG_INFO(L,  ...) do{ if(L) (L)->info (__VA_ARGS__); }while(0)
#define LOG_WARN(L,  ...) do{ if(L) (L)->warn (__VA_ARGS__); }while(0)
#define LOG_ERROR(L, ...) do{ if(L) (L)->error(__VA_ARGS__); }while(0)
#else
#define LOG_TRACE(L, ...) do{}while(0)
#define LOG_DEBUG(L, ...) do{}while(0)
#define LOG_INFO(L,  ...) do{}while(0)
#define LOG_WARN(L,  ...) do{}while(0)
#define LOG_ERROR(L, ...) do{}while(0)
#endif
