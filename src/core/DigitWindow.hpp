#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

// fixed-capacity sliding window over the last N digits.
//
// every char is stored twice, at i and at i+N, so the window contents are
// always contiguous in m_buf starting at m_head and view() needs no copy.
// push() on a full window drops the oldest char.
class DigitWindow {
    public:
    explicit DigitWindow(size_t capacity) : m_capacity(capacity), m_buf(capacity * 2) {
        if( capacity == 0 ){
            throw std::invalid_argument("window capacity must be positive");
        }
    }

    void push(char c) {
        size_t tail = (m_head + m_size) % m_capacity;
        m_buf[tail] = c;
        m_buf[tail + m_capacity] = c;
        if( m_size < m_capacity ){
            m_size++;
        } else {
            m_head = (m_head + 1) % m_capacity;
        }
    }

    void clear() {
        m_head = 0;
        m_size = 0;
    }

    size_t size() const { return m_size; }
    size_t capacity() const { return m_capacity; }
    bool empty() const { return m_size == 0; }
    bool full() const { return m_size == m_capacity; }

    // valid until the next push()/clear()
    std::string_view view() const {
        return std::string_view(m_buf.data() + m_head, m_size);
    }

    std::string str() const { return std::string(view()); }

    private:
    size_t m_capacity;
    size_t m_head = 0;
    size_t m_size = 0;
    std::vector<char> m_buf;
};
