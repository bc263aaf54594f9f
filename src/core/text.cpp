#include <cellflow/core/text.h>

namespace cellflow::core {

size_t utf8_char_len(unsigned char lead) {
    if ((lead & 0x80) == 0) return 1;
    if ((lead & 0xE0) == 0xC0) return 2;
    if ((lead & 0xF0) == 0xE0) return 3;
    if ((lead & 0xF8) == 0xF0) return 4;
    return 1;
}

std::vector<std::string> split_glyphs(std::string_view text) {
    std::vector<std::string> glyphs;
    for (size_t i = 0; i < text.size();) {
        size_t len = utf8_char_len(static_cast<unsigned char>(text[i]));
        if (i + len > text.size()) len = text.size() - i;
        glyphs.emplace_back(text.substr(i, len));
        i += len;
    }
    return glyphs;
}

int display_width(std::string_view text) {
    int width = 0;
    for (size_t i = 0; i < text.size();) {
        i += utf8_char_len(static_cast<unsigned char>(text[i]));
        ++width;
    }
    return width;
}

namespace {

// Appends `word` to `lines`, breaking it into `width`-sized chunks.
void push_long_word(std::vector<std::string>& lines, std::string& current, int& current_width,
                    std::string_view word, int width) {
    auto glyphs = split_glyphs(word);
    for (auto& g : glyphs) {
        if (current_width == width) {
            lines.push_back(std::move(current));
            current.clear();
            current_width = 0;
        }
        current += g;
        ++current_width;
    }
}

void wrap_paragraph(std::vector<std::string>& lines, std::string_view paragraph, int width) {
    std::string current;
    int current_width = 0;
    size_t pos = 0;
    bool produced = false;

    while (pos < paragraph.size()) {
        size_t start = paragraph.find_first_not_of(' ', pos);
        if (start == std::string_view::npos) break;
        size_t end = paragraph.find(' ', start);
        if (end == std::string_view::npos) end = paragraph.size();
        std::string_view word = paragraph.substr(start, end - start);
        int word_width = display_width(word);
        pos = end;

        if (current_width == 0) {
            if (word_width > width) {
                push_long_word(lines, current, current_width, word, width);
            } else {
                current.assign(word);
                current_width = word_width;
            }
        } else if (current_width + 1 + word_width <= width) {
            current += ' ';
            current += word;
            current_width += 1 + word_width;
        } else {
            lines.push_back(std::move(current));
            produced = true;
            current.clear();
            current_width = 0;
            if (word_width > width) {
                push_long_word(lines, current, current_width, word, width);
            } else {
                current.assign(word);
                current_width = word_width;
            }
        }
    }

    if (current_width > 0 || !produced) {
        lines.push_back(std::move(current));
    }
}

} // namespace

std::vector<std::string> wrap_text(std::string_view text, int width) {
    std::vector<std::string> lines;
    size_t pos = 0;
    while (true) {
        size_t nl = text.find('\n', pos);
        std::string_view paragraph = text.substr(pos, nl == std::string_view::npos
                                                          ? std::string_view::npos
                                                          : nl - pos);
        if (width <= 0) {
            lines.emplace_back(paragraph);
        } else {
            wrap_paragraph(lines, paragraph, width);
        }
        if (nl == std::string_view::npos) break;
        pos = nl + 1;
    }
    return lines;
}

} // namespace cellflow::core
