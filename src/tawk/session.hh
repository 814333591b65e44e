/** \file   session.hh
 *  \brief  Run time state of a tawk program
 *  \author Copyright 2022, Matthew Gretton-Dann
 *  SPDX-License-Identifier: Apache-2.0
 */

#ifndef SRC_TAWK_SESSION_HH_INCLUDED
#define SRC_TAWK_SESSION_HH_INCLUDED

#include <cstdio>
#include <map>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

#include "fields.hh"
#include "foreign.hh"
#include "program.hh"
#include "tawk.hh"
#include "value.hh"

namespace Tawk::Details {

/** \brief  A variable cell: uninitialized, a scalar, or an array.
 *
 * Arrays are shared so that they can be passed to functions by reference.  An uninitialized
 * function argument remembers the caller's variable in \a caller, so that using it as an array
 * makes the caller's variable that array too.
 */
struct Variable
{
  std::variant<std::monostate, Value, std::shared_ptr<Array>> value;  ///< Contents
  Variable* caller{nullptr};  ///< Caller's variable for uninitialized arguments.
};

/** \brief  Call frame of a user function.  */
struct Frame
{
  std::vector<Variable> locals;  ///< Parameters and locals, in declaration order.
  Value result;                  ///< Value given to return.
};

/** \brief  How control leaves a statement.  */
enum class Flow { normal, break_, continue_, next, nextfile, exit, return_ };

/** \brief  Thrown to carry next, nextfile, and exit out of function calls.  */
struct ControlTransfer
{
  Flow flow;
};

/** \brief  Reads records from a Reader.  */
class RecordReader
{
public:
  explicit RecordReader(std::unique_ptr<Reader> reader);
  ~RecordReader() = default;
  RecordReader(RecordReader const&) = delete;
  RecordReader(RecordReader&&) noexcept = delete;
  auto operator=(RecordReader const&) -> RecordReader& = delete;
  auto operator=(RecordReader&&) noexcept -> RecordReader& = delete;

  /** \brief         Read the next record.
   *  \param  record Where to store the record.
   *  \param  rs     Record separator.  Only the first character is used, "" means paragraph mode.
   *  \return        \c false at end of input.
   */
  auto read(std::string& record, std::string const& rs) -> bool;

private:
  auto read_paragraph(std::string& record) -> bool;

  std::unique_ptr<Reader> reader_;  ///< Underlying reader.
};

/** \brief  An output destination.  */
class OutputStream
{
public:
  OutputStream() = default;
  virtual ~OutputStream() = default;
  OutputStream(OutputStream const&) = delete;
  OutputStream(OutputStream&&) noexcept = delete;
  auto operator=(OutputStream const&) -> OutputStream& = delete;
  auto operator=(OutputStream&&) noexcept -> OutputStream& = delete;

  /** \brief  Write \a s.  Throws RuntimeIOError on failure.  */
  virtual void write(std::string_view s, Location const& loc) = 0;

  /** \brief  Flush buffered output.  \return \c false on failure.  */
  virtual auto flush() -> bool = 0;

  /** \brief  Close the stream.  \return 0 on success, -1 or the command's exit status.  */
  virtual auto close() -> int = 0;
};

/** \brief  The set of open output streams, indexed by file name or command.  */
class OutputStreams
{
public:
  /** \brief      Constructor
   *  \param  out Stream to use for standard output.
   */
  explicit OutputStreams(std::ostream& out);
  ~OutputStreams();
  OutputStreams(OutputStreams const&) = delete;
  OutputStreams(OutputStreams&&) noexcept = delete;
  auto operator=(OutputStreams const&) -> OutputStreams& = delete;
  auto operator=(OutputStreams&&) noexcept -> OutputStreams& = delete;

  /** \brief  Get standard output.  */
  auto standard_output() -> OutputStream&;

  /** \brief           Get the stream for a redirection, opening it if necessary.
   *  \param  redirect Kind of redirection.
   *  \param  name     File name or command.
   *  \param  loc      Location to report errors against.
   *
   * Throws RuntimeIOError if the stream cannot be opened.
   */
  auto get(Ast::Print::Redirect redirect, std::string const& name, Location const& loc)
    -> OutputStream&;

  /** \brief  Close stream \a name.  \return Result of closing, or std::nullopt if not open.  */
  auto close(std::string const& name) -> std::optional<int>;

  /** \brief  Flush stream \a name.  \return \c false if \a name isn't open or the flush failed. */
  auto flush(std::string const& name) -> bool;

  /** \brief  Flush everything, including standard output.  \return \c false on any failure.  */
  auto flush_all() -> bool;

  /** \brief  Close all streams, and flush standard output.  */
  void close_all();

private:
  std::unique_ptr<OutputStream> stdout_;                            ///< Standard output.
  std::unique_ptr<OutputStream> stderr_;                            ///< Standard error.
  std::map<std::string, std::unique_ptr<OutputStream>> streams_;  ///< Open redirections.
};

/** \brief  Runtime functions which are not keywords, and so resolve like user functions.  */
enum class RuntimeBuiltin { field, asort, asorti };

/** \brief  Resolution of a call site.  */
using Callee =
  std::variant<RuntimeBuiltin, Ast::FunctionDef const*, std::shared_ptr<ForeignFunction>>;

/** \brief  Resolved assignable location.  */
struct LValue
{
  enum class Kind { variable, element, field };
  Kind kind;                            ///< Which of the following is valid.
  Ast::VarRef const* var{nullptr};      ///< Variable
  Value* element{nullptr};              ///< Array element
  std::size_t field{0};                 ///< Field index
};

/** \brief  All of the state of a running program, and the tree walker over it.  */
class ExecutionState
{
public:
  /** \brief          Constructor
   *  \param  program Program to run.
   *  \param  out     Standard output.
   *  \param  foreign Foreign functions.
   *
   * Sets up the initial values of the builtin variables, and ENVIRON.
   */
  ExecutionState(Program const& program, std::ostream& out, ForeignFunctionRegistry& foreign);
  ~ExecutionState() = default;
  ExecutionState(ExecutionState const&) = delete;
  ExecutionState(ExecutionState&&) noexcept = delete;
  auto operator=(ExecutionState const&) -> ExecutionState& = delete;
  auto operator=(ExecutionState&&) noexcept -> ExecutionState& = delete;

  /** \brief  Process a var=value assignment.  \return \c false if \a s isn't an assignment.  */
  auto assign(std::string const& s) -> bool;

  /** \brief  Set ARGV and ARGC from the operands.  ARGV[0] is the program name.  */
  void set_operands(std::vector<std::string> const& operands);

  /** \brief  Read main input from \a reader instead of the ARGV operands.  */
  void set_input(std::unique_ptr<Reader> reader);

  /** \brief  Run BEGIN, the main loop, and END.  \return Exit status.  */
  auto run() -> int;

  /** \brief  Get the value of global variable \a name.  */
  [[nodiscard]] auto global(std::string const& name) const -> Value;

  /** \brief  Get the global array \a name, or nullptr if \a name isn't an array.  */
  [[nodiscard]] auto global_array(std::string const& name) const -> Array const*;

private:
  /* Variables: execute.cc.  */
  auto variable(Ast::VarRef const& ref) -> Variable&;
  auto read_var(Ast::VarRef const& ref, Location const& loc) -> Value;
  void write_var(Ast::VarRef const& ref, Value const& v, Location const& loc);
  auto array(Ast::VarRef const& ref, Location const& loc) -> Array&;
  auto as_array(Variable& var, std::string const& name, Location const& loc) -> Array&;
  auto subscript(Ast::ExprList const& subscripts) -> std::string;
  auto field_index(Ast::Expr const& index) -> std::size_t;
  auto resolve(Ast::Expr const& target) -> LValue;
  auto load(LValue const& lv, Location const& loc) -> Value;
  void store(LValue const& lv, Value const& v, Location const& loc);
  void set_field(std::size_t i, Value const& v, Location const& loc);
  void set_record(std::string record, Location const& loc);

  auto set_global(std::string const& name, Value v) -> Value&;
  [[nodiscard]] auto global_string(std::string const& name) const -> std::string;
  [[nodiscard]] auto global_number(std::string const& name) const -> Floating;
  [[nodiscard]] auto convfmt() const -> std::string;
  [[nodiscard]] auto paragraph_mode() const -> bool;

  /* Statements: execute.cc.  */
  auto run_action(Ast::Rule const& rule) -> Flow;
  auto rule_matches(Ast::Rule const& rule, std::size_t idx) -> bool;
  auto execute(Ast::Stmt const& stmt) -> Flow;
  auto execute(Ast::StmtPtr const& stmt) -> Flow;
  auto execute_print(Ast::Print const& print, Location const& loc) -> Flow;
  auto execute_loop(Ast::Stmt const& body, Flow& flow) -> bool;

  /* Expressions: execute.cc.  */
  auto eval(Ast::Expr const& expr) -> Value;
  auto eval_node(Ast::NumberLit const& node, Location const& loc) -> Value;
  auto eval_node(Ast::StringLit const& node, Location const& loc) -> Value;
  auto eval_node(Ast::RegexLit const& node, Location const& loc) -> Value;
  auto eval_node(Ast::Variable const& node, Location const& loc) -> Value;
  auto eval_node(Ast::Index const& node, Location const& loc) -> Value;
  auto eval_node(Ast::Field const& node, Location const& loc) -> Value;
  auto eval_node(Ast::Unary const& node, Location const& loc) -> Value;
  auto eval_node(Ast::Binary const& node, Location const& loc) -> Value;
  auto eval_node(Ast::Match const& node, Location const& loc) -> Value;
  auto eval_node(Ast::Logical const& node, Location const& loc) -> Value;
  auto eval_node(Ast::Ternary const& node, Location const& loc) -> Value;
  auto eval_node(Ast::Assign const& node, Location const& loc) -> Value;
  auto eval_node(Ast::IncDec const& node, Location const& loc) -> Value;
  auto eval_node(Ast::In const& node, Location const& loc) -> Value;
  auto eval_node(Ast::Call const& node, Location const& loc) -> Value;
  auto eval_node(Ast::BuiltinCall const& node, Location const& loc) -> Value;
  auto eval_node(Ast::Getline const& node, Location const& loc) -> Value;

  auto regex(Ast::Expr const& expr) -> std::regex const&;
  auto output_string(Value const& v) -> std::string;

  /* Function calls: execute.cc.  */
  auto resolve_callee(Ast::Call const& call, Location const& loc) -> Callee;
  auto call_user(Ast::FunctionDef const& fn, Ast::Call const& call, Location const& loc)
    -> Value;
  auto bind_argument(Ast::Expr const& arg) -> Variable;
  auto call_runtime(RuntimeBuiltin builtin, Ast::Call const& call, Location const& loc) -> Value;
  auto array_argument(Ast::Expr const& arg, std::string const& func) -> Array&;

  /* Builtin functions: builtins.cc.  */
  auto builtin_length(Ast::ExprList const& args) -> Value;
  auto builtin_substr(Ast::ExprList const& args) -> Value;
  auto builtin_index(Ast::ExprList const& args) -> Value;
  auto builtin_split(Ast::ExprList const& args, Location const& loc) -> Value;
  auto builtin_sub(Ast::ExprList const& args, bool global, Location const& loc) -> Value;
  auto builtin_match(Ast::ExprList const& args) -> Value;
  auto builtin_case(Ast::ExprList const& args, bool upper) -> Value;
  auto builtin_math(Token::BuiltinFunc func, Ast::ExprList const& args) -> Value;
  auto builtin_srand(Ast::ExprList const& args) -> Value;
  auto builtin_close(Ast::ExprList const& args) -> Value;
  auto builtin_system(Ast::ExprList const& args) -> Value;
  auto builtin_fflush(Ast::ExprList const& args) -> Value;
  auto builtin_sort(Ast::Call const& call, bool indices, Location const& loc) -> Value;

  /* Input: input.cc.  */
  auto next_main_record(std::string& record) -> bool;
  auto open_next_input() -> bool;
  auto getline(Ast::Getline const& node, Location const& loc) -> Value;

  Program const& program_;               ///< Program being run.
  ForeignFunctionRegistry& foreign_;     ///< Foreign functions.
  RegexCache regexes_;                   ///< Dynamic regular expressions.
  Fields fields_;                        ///< Current record.
  OutputStreams outputs_;                ///< Output streams.
  std::unordered_map<std::string, Variable> globals_;  ///< Global variables.
  std::vector<Frame> frames_;            ///< Call stack.
  std::unordered_map<Ast::Call const*, Callee> callees_;  ///< Resolved call sites.
  std::vector<bool> in_range_;           ///< Per rule: inside an active range?

  std::unique_ptr<RecordReader> main_input_;      ///< Current main input.
  std::unique_ptr<Reader> pending_input_;         ///< Caller supplied main input.
  std::map<std::string, std::unique_ptr<RecordReader>> input_files_;  ///< getline < file.
  Floating next_argv_{1};                          ///< Next ARGV element to process.
  bool used_file_operand_{false};                  ///< Have we read from an operand?
  bool input_exhausted_{false};                    ///< Has main input been exhausted?

  Floating seed_{0};  ///< Current random seed.
  int exit_status_{0};  ///< Exit status.
};

}  // namespace Tawk::Details

#endif  // SRC_TAWK_SESSION_HH_INCLUDED
