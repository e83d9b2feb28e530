//
// Code Writer - RAII-Based Source Text Assembly
//
// Base class for emitting generated source with automatic indentation.
// Block guards open a brace pair on construction and close it when they go
// out of scope, so generation code never balances braces by hand. Brace
// placement is a virtual hook; language writers override it.
//

#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <utility>

namespace sqlmarshal::codegen {

class IfBlock;
class WhileBlock;
class TryBlock;
class FinallyBlock;
class ScopeBlock;
class InitializerBlock;

// ============================================================================
// CodeWriter
// ============================================================================

class CodeWriter {
public:
    explicit CodeWriter(std::ostream& output);
    virtual ~CodeWriter() = default;

    CodeWriter(const CodeWriter&) = delete;
    CodeWriter& operator=(const CodeWriter&) = delete;

    // ========================================================================
    // Basic Output
    // ========================================================================

    /// Write a line with current indentation. Empty lines carry no indentation.
    virtual void write_line(const std::string& line);

    /// Write text without indentation or newline
    virtual void write_raw(const std::string& text);

    virtual void write_blank_line();

    // ========================================================================
    // Block Guards
    // ========================================================================

    IfBlock write_if(const std::string& condition);
    WhileBlock write_while(const std::string& condition);
    TryBlock write_try();

    /// Braced scope under an optional header line ("partial class C")
    ScopeBlock write_scope(const std::string& header = {});

    /// Braced initializer list closed with "};"
    InitializerBlock write_initializer(const std::string& header);

    // ========================================================================
    // Brace Placement (language hooks)
    // ========================================================================

    /// Open a block under `header` and indent
    virtual void write_block_open(const std::string& header);

    /// Unindent and close the block; `suffix` follows the closing brace
    virtual void write_block_close(const std::string& suffix);

    // ========================================================================
    // Indentation
    // ========================================================================

    void indent();
    void unindent();
    [[nodiscard]] size_t current_indent_level() const { return indent_level_; }

    void set_indent_string(const std::string& indent);
    [[nodiscard]] const std::string& get_indent_string() const { return indent_string_; }

    // ========================================================================
    // Streaming
    // ========================================================================

    /// Text accumulates until `endl`
    CodeWriter& operator<<(const std::string& text);
    CodeWriter& operator<<(const char* text);
    CodeWriter& operator<<(char c);
    CodeWriter& operator<<(int value);
    CodeWriter& operator<<(size_t value);
    CodeWriter& operator<<(CodeWriter& (*manip)(CodeWriter&));

    friend CodeWriter& endl(CodeWriter& writer);
    friend CodeWriter& blank(CodeWriter& writer);

protected:
    std::ostream& output_;

    size_t indent_level_;
    std::string indent_string_;
    std::string cached_indent_;

    std::string line_buffer_;

    void update_cached_indent();
};

/// Flush the streamed line with indentation and a newline
CodeWriter& endl(CodeWriter& writer);

/// Write a blank line
CodeWriter& blank(CodeWriter& writer);

// ============================================================================
// StreamableBlock - common guard behaviour
// ============================================================================

/**
 * CRTP base of every block guard.
 *
 * Owns the responsibility to close the block exactly once: on destruction,
 * on an explicit close(), or when a chained block (finally) takes over.
 * A moved-from guard closes nothing.
 */
template<typename Derived>
class StreamableBlock {
public:
    ~StreamableBlock() { close(); }

    StreamableBlock(const StreamableBlock&) = delete;
    StreamableBlock& operator=(const StreamableBlock&) = delete;

    StreamableBlock(StreamableBlock&& other) noexcept
        : writer_(other.writer_),
          suffix_(std::move(other.suffix_))
    {
        other.writer_ = nullptr;
    }

    StreamableBlock& operator=(StreamableBlock&& other) noexcept {
        if (this != &other) {
            close();
            writer_ = other.writer_;
            suffix_ = std::move(other.suffix_);
            other.writer_ = nullptr;
        }
        return *this;
    }

    /// Close the block before the guard leaves scope
    void close() {
        if (writer_) {
            writer_->write_block_close(suffix_);
            writer_ = nullptr;
        }
    }

    Derived& operator<<(const std::string& text) {
        *writer_ << text;
        return static_cast<Derived&>(*this);
    }

    Derived& operator<<(const char* text) {
        *writer_ << text;
        return static_cast<Derived&>(*this);
    }

    Derived& operator<<(CodeWriter& (*manip)(CodeWriter&)) {
        *writer_ << manip;
        return static_cast<Derived&>(*this);
    }

protected:
    StreamableBlock(CodeWriter* writer, const std::string& header, std::string suffix = {})
        : writer_(writer),
          suffix_(std::move(suffix))
    {
        writer_->write_block_open(header);
    }

    CodeWriter* writer_;
    std::string suffix_;
};

// ============================================================================
// Block Guards
// ============================================================================

class IfBlock : public StreamableBlock<IfBlock> {
public:
    IfBlock(CodeWriter* writer, const std::string& condition);
};

class WhileBlock : public StreamableBlock<WhileBlock> {
public:
    WhileBlock(CodeWriter* writer, const std::string& condition);
};

class FinallyBlock : public StreamableBlock<FinallyBlock> {
public:
    explicit FinallyBlock(CodeWriter* writer);
};

class TryBlock : public StreamableBlock<TryBlock> {
public:
    explicit TryBlock(CodeWriter* writer);

    /// Close the try body and open the cleanup clause
    FinallyBlock write_finally();
};

class ScopeBlock : public StreamableBlock<ScopeBlock> {
public:
    ScopeBlock(CodeWriter* writer, const std::string& header);
};

class InitializerBlock : public StreamableBlock<InitializerBlock> {
public:
    InitializerBlock(CodeWriter* writer, const std::string& header);
};

}  // namespace sqlmarshal::codegen
