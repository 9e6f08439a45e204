#include "termdash/input.hpp"

namespace termdash {

namespace {

KeyEvent arrow_key(char final_byte) {
    switch (final_byte) {
        case 'A': return KeyEvent::key(KeyCode::Up);
        case 'B': return KeyEvent::key(KeyCode::Down);
        case 'C': return KeyEvent::key(KeyCode::Right);
        case 'D': return KeyEvent::key(KeyCode::Left);
    }
    return KeyEvent::key(KeyCode::Unknown);
}

// Decode the key starting at `pos` and return how many bytes it used.
// `truncated` is set when the input ends inside an escape sequence.
size_t decode_one(const std::string& bytes, size_t pos, KeyEvent& out, bool& truncated) {
    const size_t size = bytes.size();
    unsigned char c = static_cast<unsigned char>(bytes[pos]);
    truncated = false;

    if (c == 0x1B) {
        if (pos + 1 >= size) {
            truncated = true;
            out = KeyEvent::key(KeyCode::Escape);
            return 1;
        }

        char intro = bytes[pos + 1];
        if (intro == 'O') {
            // SS3: exactly one final byte
            if (pos + 2 >= size) {
                truncated = true;
                out = KeyEvent::key(KeyCode::Unknown);
                return 2;
            }
            out = arrow_key(bytes[pos + 2]);
            return 3;
        }
        if (intro == '[') {
            // CSI: parameter and intermediate bytes, then one final byte
            size_t end = pos + 2;
            while (end < size && bytes[end] >= 0x20 && bytes[end] <= 0x3F) {
                ++end;
            }
            if (end >= size) {
                truncated = true;
                out = KeyEvent::key(KeyCode::Unknown);
                return size - pos;
            }

            std::string params = bytes.substr(pos + 2, end - pos - 2);
            if (params.empty()) {
                out = arrow_key(bytes[end]);
            } else if (params == "3" && bytes[end] == '~') {
                out = KeyEvent::key(KeyCode::Delete);
            } else {
                out = KeyEvent::key(KeyCode::Unknown);
            }
            return end - pos + 1;
        }

        // ESC followed by an ordinary key: the next key is decoded on its own
        out = KeyEvent::key(KeyCode::Escape);
        return 1;
    }

    switch (c) {
        case '\r':
        case '\n':
            out = KeyEvent::key(KeyCode::Enter);
            return 1;
        case 0x7F:
        case 0x08:
            out = KeyEvent::key(KeyCode::Backspace);
            return 1;
        case '\t':
            out = KeyEvent::key(KeyCode::Tab);
            return 1;
    }

    // Printable ASCII and the bytes of UTF-8 characters
    if ((c >= 0x20 && c < 0x7F) || c >= 0x80) {
        out = KeyEvent::character(static_cast<char>(c));
    } else {
        out = KeyEvent::key(KeyCode::Unknown);
    }
    return 1;
}

} // namespace

std::vector<KeyEvent> decode_keys(const std::string& bytes) {
    std::vector<KeyEvent> keys;
    size_t pos = 0;
    while (pos < bytes.size()) {
        KeyEvent key;
        bool truncated = false;
        pos += decode_one(bytes, pos, key, truncated);
        keys.push_back(key);
    }
    return keys;
}

bool has_partial_escape(const std::string& bytes) {
    size_t pos = 0;
    bool truncated = false;
    while (pos < bytes.size()) {
        KeyEvent key;
        pos += decode_one(bytes, pos, key, truncated);
    }
    return truncated;
}

} // namespace termdash
