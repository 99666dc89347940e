#include "output.h"

#include <iostream>

void DefaultOutput::write(
    const char *name,
    const char *tag,
    std::string &&s) {

    std::lock_guard<std::mutex> lock(m_mutex);
    std::cerr << name << "::" << tag << ": " << s << std::endl;
}

void TestOutput::write(
    const char *name,
    const char *tag,
    std::string &&s) {

    std::lock_guard<std::mutex> lock(m_mutex);
    std::ostringstream line;
    line << name << "::" << tag << ": " << s;
    m_output.emplace_back(line.str());
}

void TestOutput::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_output.clear();
}

bool TestOutput::empty() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_output.empty();
}

bool TestOutput::test_empty() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_output.empty()) {
        for (const std::string &s : m_output) {
            std::cout << "unexpected output: " << s << std::endl;
        }
        m_output.clear();
        return false;
    } else {
        return true;
    }
}

bool TestOutput::test_line(const std::string &expected) {
    std::lock_guard<std::mutex> lock(m_mutex);
    bool fail = false;
    std::string actual;

    if (m_output.size() >= 1) {
        actual = m_output.front();
        if (expected != actual) {
            fail = true;
        } else {
            m_output.erase(m_output.begin());
        }
    } else {
        fail = true;
        actual = "(nothing)";
    }

    if (fail) {
        std::cout << "output mismatch: " << std::endl;
        std::cout << "expected: " << expected << std::endl;
        std::cout << "actual: " << actual << std::endl;
        return false;
    } else {
        return true;
    }
}

bool TestOutput::contains(const std::string &tag) {
    std::lock_guard<std::mutex> lock(m_mutex);
    const std::string needle = "::" + tag + ":";
    for (const std::string &s : m_output) {
        if (s.find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}
