#pragma once
#include <iosfwd>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace rnr {
    enum class Stream { Out, Err };

    // Descriptors a child process may write to directly instead of through
    // line capture.
    struct Passthrough {
        int out_fd;
        int err_fd;
    };

    // Receives the output of one running command, one complete line at a time.
    class OutputChannel {
    public:
        virtual ~OutputChannel() = default;

        // `text` has no trailing newline.
        virtual void line(Stream stream, const std::string &text) = 0;

        // Called once the command has exited.
        virtual void finish() = 0;

        // Set when the command should inherit these descriptors as its
        // stdout/stderr; line() then only carries rnr's own messages.
        [[nodiscard]] virtual std::optional<Passthrough> passthrough() const { return std::nullopt; }
    };

    // Where command output ends up. Implementations never write less than a
    // whole line at a time, so concurrent commands can't interleave mid-line.
    class OutputSink {
    public:
        virtual ~OutputSink() = default;

        // `concurrent` is true for commands running inside a parallel group.
        virtual std::unique_ptr<OutputChannel> open(const std::string &label, bool concurrent) = 0;
    };

    enum class OutputMode { Stream, Prefix, Buffer };

    std::optional<OutputMode> parse_output_mode(const std::string &name);

    const char *output_mode_name(OutputMode mode);

    // Lines go straight through. A command running on its own writes to the
    // process's stdout/stderr directly when `out`/`err` are std::cout/std::cerr.
    class StreamingSink final : public OutputSink {
    public:
        StreamingSink(std::ostream &out, std::ostream &err);

        // Inherit these descriptors for non-concurrent commands whatever the streams are.
        StreamingSink(std::ostream &out, std::ostream &err, Passthrough fds);

        std::unique_ptr<OutputChannel> open(const std::string &label, bool concurrent) override;

        void write(Stream stream, const std::string &text);

        // Several lines at once, under the same lock as write().
        void write_block(const std::string &out_text, const std::string &err_text);

    private:
        std::ostream &out;
        std::ostream &err;
        std::optional<Passthrough> fds;
        std::mutex mtx;
    };

    // Lines of concurrent commands get a "[label] " prefix.
    class PrefixedSink final : public OutputSink {
    public:
        PrefixedSink(std::ostream &out, std::ostream &err);

        std::unique_ptr<OutputChannel> open(const std::string &label, bool concurrent) override;

    private:
        StreamingSink target;
    };

    // Output of concurrent commands is held back and written in one piece when
    // the command finishes; sequential commands stream.
    class BufferedSink final : public OutputSink {
    public:
        BufferedSink(std::ostream &out, std::ostream &err);

        std::unique_ptr<OutputChannel> open(const std::string &label, bool concurrent) override;

    private:
        StreamingSink target;
    };

    std::unique_ptr<OutputSink> make_sink(OutputMode mode, std::ostream &out, std::ostream &err);
} // namespace rnr
