/** \file   output.cc
 *  \brief  tawk output streams
 *  \author Copyright 2022, Matthew Gretton-Dann
 *  SPDX-License-Identifier: Apache-2.0
 */

#include "tawk-messages.hh"

#include <sys/wait.h>

#include <cstdio>
#include <iostream>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

#include "session.hh"

namespace {
/** \brief  Output to a std::ostream.  Used for standard output and standard error.  */
class StdOutput final : public Tawk::Details::OutputStream
{
public:
  explicit StdOutput(std::ostream& os) : os_(os) {}

  void write(std::string_view s, Tawk::Location const& loc) override
  {
    os_.write(s.data(), static_cast<std::streamsize>(s.size()));
    if (!os_) {
      throw Tawk::RuntimeIOError(
        loc, Tawk::Messages::get().format(Tawk::Msg::output_error, "standard output"));
    }
  }

  auto flush() -> bool override
  {
    os_.flush();
    return static_cast<bool>(os_);
  }

  auto close() -> int override { return flush() ? 0 : -1; }

private:
  std::ostream& os_;  ///< Stream to write to.
};

/** \brief  Output to a file.  */
class FileOutput final : public Tawk::Details::OutputStream
{
public:
  /** \brief         Open \a name.
   *  \param  name   File name
   *  \param  append Append rather than truncate?
   *  \param  loc    Location to report errors against.
   */
  FileOutput(std::string name, bool append, Tawk::Location const& loc)
      : name_(std::move(name)), file_(std::fopen(name_.c_str(), append ? "a" : "w"))
  {
    if (file_ == nullptr) {
      throw Tawk::RuntimeIOError(loc,
                                 Tawk::Messages::get().format(Tawk::Msg::output_open_error, name_));
    }
  }

  ~FileOutput() override { (void)close(); }
  FileOutput(FileOutput const&) = delete;
  FileOutput(FileOutput&&) noexcept = delete;
  auto operator=(FileOutput const&) -> FileOutput& = delete;
  auto operator=(FileOutput&&) noexcept -> FileOutput& = delete;

  void write(std::string_view s, Tawk::Location const& loc) override
  {
    if (std::fwrite(s.data(), 1, s.size(), file_) != s.size()) {
      throw Tawk::RuntimeIOError(loc, Tawk::Messages::get().format(Tawk::Msg::output_error, name_));
    }
  }

  auto flush() -> bool override { return file_ != nullptr && std::fflush(file_) == 0; }

  auto close() -> int override
  {
    if (file_ == nullptr) {
      return -1;
    }
    int const result{std::fclose(file_)};
    file_ = nullptr;
    return result == 0 ? 0 : -1;
  }

private:
  std::string name_;  ///< File name
  FILE* file_;        ///< File handle.
};

/** \brief  Output piped into a shell command.  */
class PipeOutput final : public Tawk::Details::OutputStream
{
public:
  PipeOutput(std::string command, Tawk::Location const& loc)
      : command_(std::move(command)), pipe_(::popen(command_.c_str(), "w"))
  {
    if (pipe_ == nullptr) {
      throw Tawk::RuntimeIOError(loc,
                                 Tawk::Messages::get().format(Tawk::Msg::pipe_open_error, command_));
    }
  }

  ~PipeOutput() override { (void)close(); }
  PipeOutput(PipeOutput const&) = delete;
  PipeOutput(PipeOutput&&) noexcept = delete;
  auto operator=(PipeOutput const&) -> PipeOutput& = delete;
  auto operator=(PipeOutput&&) noexcept -> PipeOutput& = delete;

  void write(std::string_view s, Tawk::Location const& loc) override
  {
    if (std::fwrite(s.data(), 1, s.size(), pipe_) != s.size()) {
      throw Tawk::RuntimeIOError(loc,
                                 Tawk::Messages::get().format(Tawk::Msg::output_error, command_));
    }
  }

  auto flush() -> bool override { return pipe_ != nullptr && std::fflush(pipe_) == 0; }

  auto close() -> int override
  {
    if (pipe_ == nullptr) {
      return -1;
    }
    int const status{::pclose(pipe_)};
    pipe_ = nullptr;
    if (status == -1) {
      return -1;
    }
    return WIFEXITED(status) ? WEXITSTATUS(status) : -1;  // NOLINT(hicpp-signed-bitwise)
  }

private:
  std::string command_;  ///< Command
  FILE* pipe_;           ///< Pipe handle.
};
}  // namespace

Tawk::Details::OutputStreams::OutputStreams(std::ostream& out)
    : stdout_(std::make_unique<StdOutput>(out)), stderr_(std::make_unique<StdOutput>(std::cerr))
{
}

Tawk::Details::OutputStreams::~OutputStreams() { close_all(); }

auto Tawk::Details::OutputStreams::standard_output() -> OutputStream& { return *stdout_; }

auto Tawk::Details::OutputStreams::get(Ast::Print::Redirect redirect, std::string const& name,
                                       Location const& loc) -> OutputStream&
{
  if (name == "/dev/stdout" || name == "-") {
    return *stdout_;
  }
  if (name == "/dev/stderr") {
    return *stderr_;
  }

  auto it{streams_.find(name)};
  if (it != streams_.end()) {
    return *it->second;
  }

  /* Everything writes to standard output in order, so flush what we have before a command can
   * write to it.  */
  (void)stdout_->flush();

  std::unique_ptr<OutputStream> stream;
  switch (redirect) {
  case Ast::Print::Redirect::pipe:
    stream = std::make_unique<PipeOutput>(name, loc);
    break;
  case Ast::Print::Redirect::append:
    stream = std::make_unique<FileOutput>(name, true, loc);
    break;
  case Ast::Print::Redirect::truncate:
  case Ast::Print::Redirect::none:
    stream = std::make_unique<FileOutput>(name, false, loc);
    break;
  }

  return *streams_.emplace(name, std::move(stream)).first->second;
}

auto Tawk::Details::OutputStreams::close(std::string const& name) -> std::optional<int>
{
  auto it{streams_.find(name)};
  if (it == streams_.end()) {
    return std::nullopt;
  }

  (void)stdout_->flush();
  int const result{it->second->close()};
  streams_.erase(it);
  return result;
}

auto Tawk::Details::OutputStreams::flush(std::string const& name) -> bool
{
  if (name == "/dev/stdout" || name == "-") {
    return stdout_->flush();
  }
  if (name == "/dev/stderr") {
    return stderr_->flush();
  }

  auto it{streams_.find(name)};
  if (it == streams_.end()) {
    return false;
  }
  return it->second->flush();
}

auto Tawk::Details::OutputStreams::flush_all() -> bool
{
  bool success{stdout_->flush()};
  success = stderr_->flush() && success;
  for (auto& [name, stream] : streams_) {
    success = stream->flush() && success;
  }
  return success;
}

void Tawk::Details::OutputStreams::close_all()
{
  (void)stdout_->flush();
  for (auto& [name, stream] : streams_) {
    (void)stream->close();
  }
  streams_.clear();
  (void)stderr_->flush();
}
