//
// Code Writer Implementation
//

#include <sqlmarshal/codegen/code_writer.hh>

namespace sqlmarshal::codegen {

// ============================================================================
// CodeWriter
// ============================================================================

CodeWriter::CodeWriter(std::ostream& output)
    : output_(output),
      indent_level_(0),
      indent_string_("    "),
      cached_indent_(),
      line_buffer_()
{
}

void CodeWriter::write_line(const std::string& line) {
    if (!line.empty()) {
        output_ << cached_indent_ << line;
    }
    output_ << '\n';
}

void CodeWriter::write_raw(const std::string& text) {
    output_ << text;
}

void CodeWriter::write_blank_line() {
    output_ << '\n';
}

void CodeWriter::indent() {
    indent_level_++;
    update_cached_indent();
}

void CodeWriter::unindent() {
    if (indent_level_ > 0) {
        indent_level_--;
        update_cached_indent();
    }
}

void CodeWriter::set_indent_string(const std::string& indent) {
    indent_string_ = indent;
    update_cached_indent();
}

void CodeWriter::update_cached_indent() {
    cached_indent_.clear();
    for (size_t i = 0; i < indent_level_; ++i) {
        cached_indent_ += indent_string_;
    }
}

void CodeWriter::write_block_open(const std::string& header) {
    write_line(header.empty() ? "{" : header + " {");
    indent();
}

void CodeWriter::write_block_close(const std::string& suffix) {
    unindent();
    write_line("}" + suffix);
}

IfBlock CodeWriter::write_if(const std::string& condition) {
    return IfBlock(this, condition);
}

WhileBlock CodeWriter::write_while(const std::string& condition) {
    return WhileBlock(this, condition);
}

TryBlock CodeWriter::write_try() {
    return TryBlock(this);
}

ScopeBlock CodeWriter::write_scope(const std::string& header) {
    return ScopeBlock(this, header);
}

InitializerBlock CodeWriter::write_initializer(const std::string& header) {
    return InitializerBlock(this, header);
}

// ============================================================================
// Streaming
// ============================================================================

CodeWriter& CodeWriter::operator<<(const std::string& text) {
    line_buffer_ += text;
    return *this;
}

CodeWriter& CodeWriter::operator<<(const char* text) {
    if (text) {
        line_buffer_ += text;
    }
    return *this;
}

CodeWriter& CodeWriter::operator<<(char c) {
    line_buffer_ += c;
    return *this;
}

CodeWriter& CodeWriter::operator<<(int value) {
    line_buffer_ += std::to_string(value);
    return *this;
}

CodeWriter& CodeWriter::operator<<(size_t value) {
    line_buffer_ += std::to_string(value);
    return *this;
}

CodeWriter& CodeWriter::operator<<(CodeWriter& (*manip)(CodeWriter&)) {
    return manip(*this);
}

CodeWriter& endl(CodeWriter& writer) {
    writer.write_line(writer.line_buffer_);
    writer.line_buffer_.clear();
    return writer;
}

CodeWriter& blank(CodeWriter& writer) {
    writer.write_blank_line();
    return writer;
}

// ============================================================================
// Block Guards
// ============================================================================

IfBlock::IfBlock(CodeWriter* writer, const std::string& condition)
    : StreamableBlock<IfBlock>(writer, "if (" + condition + ")")
{
}

WhileBlock::WhileBlock(CodeWriter* writer, const std::string& condition)
    : StreamableBlock<WhileBlock>(writer, "while (" + condition + ")")
{
}

TryBlock::TryBlock(CodeWriter* writer)
    : StreamableBlock<TryBlock>(writer, "try")
{
}

FinallyBlock TryBlock::write_finally() {
    CodeWriter* writer = writer_;
    close();
    return FinallyBlock(writer);
}

FinallyBlock::FinallyBlock(CodeWriter* writer)
    : StreamableBlock<FinallyBlock>(writer, "finally")
{
}

ScopeBlock::ScopeBlock(CodeWriter* writer, const std::string& header)
    : StreamableBlock<ScopeBlock>(writer, header)
{
}

InitializerBlock::InitializerBlock(CodeWriter* writer, const std::string& header)
    : StreamableBlock<InitializerBlock>(writer, header, ";")
{
}

}  // namespace sqlmarshal::codegen
