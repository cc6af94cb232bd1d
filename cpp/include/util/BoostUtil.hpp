#pragma once

#include "util/CppUtil.hpp"

#include <boost/program_options.hpp>

#include <ostream>
#include <string>

namespace boost_util {

namespace program_options {

struct Settings {
  // When set, options_description::print() includes the no-op half of every flag.
  static inline bool help_full = false;
};

/*
 * Wraps boost::program_options::options_description so that option names (and one-letter
 * abbreviations) are template arguments. Every name added so far is part of the type, so adding
 * the same name twice, or merging two descriptions that share a name, fails to compile instead of
 * failing at runtime.
 *
 * Each add*() call returns a new object of a new type, so calls are chained:
 *
 * namespace po = boost::program_options;
 * namespace po2 = boost_util::program_options;
 *
 * po2::options_description desc("Game options");
 * return desc.add_option<"seed", 's'>(po::value<int>(&seed), "random seed")
 *   .add_flag<"verbose", "quiet">(&verbose, "log more", "log less");
 */
template <typename StrSeq_ = util::StringLiteralSequence<>,
          util::concepts::IntSequence CharSeq_ = util::int_sequence<>>
class options_description {
 public:
  using StrSeq = StrSeq_;
  using CharSeq = CharSeq_;

  using base_t = boost::program_options::options_description;

  options_description(const char* name);

  /*
   * Equivalent to base_t::add_options()(name, ts...), with Abbrev, if given, as the one-letter
   * short form.
   */
  template <util::StringLiteral Name, char Abbrev = ' ', typename... Ts>
  auto add_option(Ts&&... ts);

  /*
   * Adds a pair of options, --TrueName and --FalseName, that set *flag to true and false
   * respectively. Whichever of the two matches the current value of *flag is a no-op; it is
   * labeled as such, and omitted from the help output unless Settings::help_full is set.
   */
  template <util::StringLiteral TrueName, util::StringLiteral FalseName>
  auto add_flag(bool* flag, const char* true_help, const char* false_help);

  // Merges all the options of desc into this.
  template <typename StrSeq2, util::concepts::IntSequence CharSeq2>
  auto add(const options_description<StrSeq2, CharSeq2>& desc);

  void print(std::ostream& s) const;

  friend std::ostream& operator<<(std::ostream& s, const options_description& desc) {
    desc.print(s);
    return s;
  }

  // Contains every option, including both halves of every flag. This is what parsing uses.
  const base_t& get() const { return *full_base_; }
  base_t& get() { return *full_base_; }

 private:
  options_description(base_t* full_base, base_t* base) : full_base_(full_base), base_(base) {}

  template <util::StringLiteral Name, char Abbrev = ' '>
  auto augment() const;

  static void add_flag_half(base_t* base, const char* name, bool* flag, bool value,
                            const std::string& help);

  template <typename, util::concepts::IntSequence>
  friend class boost_util::program_options::options_description;

  // Shared by every description in an add*() chain, and intentionally never freed: both hold the
  // same value_semantic pointers, and each would delete them.
  base_t* full_base_;
  base_t* base_;
  std::string tmp_str_;  // "name" or "name,a", as boost expects it
};

/*
 * Parses the command line described by ts (argc/argv, or a vector of strings) against desc,
 * which may be a boost or a boost_util options_description. Stores into the variables bound to
 * desc's options, and returns the variables_map.
 *
 * Any boost parse error is rethrown as util::CleanException.
 */
template <typename T, typename... Ts>
boost::program_options::variables_map parse_args(const T& desc, Ts&&... ts);

}  // namespace program_options

}  // namespace boost_util

#include "inline/util/BoostUtil.inl"
