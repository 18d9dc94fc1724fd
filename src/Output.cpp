#include "../include/Output.hpp"
#include <iostream>
#include <utility>
#include <unistd.h>

using namespace rnr;

namespace {
    class DirectChannel final : public OutputChannel {
    public:
        DirectChannel(StreamingSink &target, std::string prefix, const std::optional<Passthrough> fds = std::nullopt)
            : target(target), prefix(std::move(prefix)), fds(fds) {
        }

        void line(const Stream stream, const std::string &text) override {
            target.write(stream, prefix.empty() ? text : prefix + text);
        }

        void finish() override {
        }

        [[nodiscard]] std::optional<Passthrough> passthrough() const override { return fds; }

    private:
        StreamingSink &target;
        std::string prefix;
        std::optional<Passthrough> fds;
    };

    class BufferChannel final : public OutputChannel {
    public:
        explicit BufferChannel(StreamingSink &target) : target(target) {
        }

        void line(const Stream stream, const std::string &text) override {
            std::string &buf = stream == Stream::Err ? err_text : out_text;
            buf += text;
            buf += '\n';
        }

        void finish() override {
            target.write_block(out_text, err_text);
            out_text.clear();
            err_text.clear();
        }

    private:
        StreamingSink &target;
        std::string out_text;
        std::string err_text;
    };
} // namespace

std::optional<OutputMode> rnr::parse_output_mode(const std::string &name) {
    if (name == "stream") return OutputMode::Stream;
    if (name == "prefix") return OutputMode::Prefix;
    if (name == "buffer") return OutputMode::Buffer;
    return std::nullopt;
}

const char *rnr::output_mode_name(const OutputMode mode) {
    switch (mode) {
        case OutputMode::Stream: return "stream";
        case OutputMode::Prefix: return "prefix";
        case OutputMode::Buffer: return "buffer";
    }
    return "prefix";
}

StreamingSink::StreamingSink(std::ostream &out, std::ostream &err) : out(out), err(err) {
    if (&out == &std::cout && &err == &std::cerr) fds = Passthrough{STDOUT_FILENO, STDERR_FILENO};
}

StreamingSink::StreamingSink(std::ostream &out, std::ostream &err, const Passthrough fds)
    : out(out), err(err), fds(fds) {
}

std::unique_ptr<OutputChannel> StreamingSink::open(const std::string &, const bool concurrent) {
    return std::make_unique<DirectChannel>(*this, std::string(), concurrent ? std::optional<Passthrough>() : fds);
}

void StreamingSink::write(const Stream stream, const std::string &text) {
    std::lock_guard lock(mtx);
    std::ostream &os = stream == Stream::Err ? err : out;
    os << text << '\n' << std::flush;
}

void StreamingSink::write_block(const std::string &out_text, const std::string &err_text) {
    if (out_text.empty() && err_text.empty()) return;
    std::lock_guard lock(mtx);
    out << out_text << std::flush;
    err << err_text << std::flush;
}

PrefixedSink::PrefixedSink(std::ostream &out, std::ostream &err) : target(out, err) {
}

std::unique_ptr<OutputChannel> PrefixedSink::open(const std::string &label, const bool concurrent) {
    if (!concurrent) return target.open(label, false);
    return std::make_unique<DirectChannel>(target, "[" + label + "] ");
}

BufferedSink::BufferedSink(std::ostream &out, std::ostream &err) : target(out, err) {
}

std::unique_ptr<OutputChannel> BufferedSink::open(const std::string &label, const bool concurrent) {
    if (!concurrent) return target.open(label, false);
    return std::make_unique<BufferChannel>(target);
}

std::unique_ptr<OutputSink> rnr::make_sink(const OutputMode mode, std::ostream &out, std::ostream &err) {
    switch (mode) {
        case OutputMode::Stream: return std::make_unique<StreamingSink>(out, err);
        case OutputMode::Buffer: return std::make_unique<BufferedSink>(out, err);
        case OutputMode::Prefix: break;
    }
    return std::make_unique<PrefixedSink>(out, err);
}
