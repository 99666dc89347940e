#ifndef CDUCKLING_OUTPUT_H
#define CDUCKLING_OUTPUT_H

#include <list>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>

class Output {
public:
    virtual ~Output() {
    }

    virtual void write(
        const char *name,
        const char *tag,
        std::string &&s) = 0;
};

using OutputRef = std::shared_ptr<Output>;

class DefaultOutput : public Output {
private:
    std::mutex m_mutex;

public:
    virtual void write(
        const char *name,
        const char *tag,
        std::string &&s);
};

class NoOutput : public Output {
public:
    virtual void write(
        const char *name,
        const char *tag,
        std::string &&s) {
    }
};

class TestOutput : public Output {
private:
    std::mutex m_mutex;
    std::list<std::string> m_output;

public:
    virtual void write(
        const char *name,
        const char *tag,
        std::string &&s);

    void clear();

    bool empty();

    bool test_empty();

    bool test_line(const std::string &expected);

    bool contains(const std::string &tag);
};

inline std::string message_placeholder(size_t index) {
    std::ostringstream s;
    s << "`";
    s << index;
    s << "`";
    return s.str();
}

inline std::string message_text(std::string &&text, size_t index) {
    return text;
}

template<typename Arg, typename... Args>
std::string message_text(
    std::string &&text,
    size_t index,
    const Arg &arg,
    const Args&... args) {

    std::string new_text(text);
    const std::string placeholder(message_placeholder(index));

    const auto pos = new_text.find(placeholder);
    if (pos != std::string::npos) {
        std::ostringstream s;
        s << arg;
        new_text = new_text.replace(pos, placeholder.length(), s.str());
    }

    return message_text(std::move(new_text), index + 1, args...);
}

// writes a message template such as "stopped after `1` passes" with
// its placeholders filled in from args.
template<typename... Args>
void message(
    const OutputRef &output,
    const char *name,
    const char *tag,
    const char *text_template,
    const Args&... args) {

    if (output) {
        output->write(name, tag, message_text(std::string(text_template), 1, args...));
    }
}

#endif // CDUCKLING_OUTPUT_H
