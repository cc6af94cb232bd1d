#include "util/BoostUtil.hpp"

#include "util/Exceptions.hpp"
#include "util/ScreenUtil.hpp"

namespace boost_util {

namespace program_options {

template <typename StrSeq, util::concepts::IntSequence CharSeq>
options_description<StrSeq, CharSeq>::options_description(const char* name)
    : full_base_(new base_t(name, util::get_screen_width() - 1)),
      base_(new base_t(name, util::get_screen_width() - 1)) {}

template <typename StrSeq, util::concepts::IntSequence CharSeq>
template <util::StringLiteral Name, char Abbrev, typename... Ts>
auto options_description<StrSeq, CharSeq>::add_option(Ts&&... ts) {
  auto out = augment<Name, Abbrev>();
  const char* name = out.tmp_str_.c_str();

  out.full_base_->add_options()(name, ts...);
  out.base_->add_options()(name, std::forward<Ts>(ts)...);
  return out;
}

template <typename StrSeq, util::concepts::IntSequence CharSeq>
template <util::StringLiteral TrueName, util::StringLiteral FalseName>
auto options_description<StrSeq, CharSeq>::add_flag(bool* flag, const char* true_help,
                                                    const char* false_help) {
  auto out = augment<TrueName>().template augment<FalseName>();

  std::string no_op = " (no-op)";
  std::string full_true_help = std::string(true_help) + (*flag ? no_op : "");
  std::string full_false_help = std::string(false_help) + (*flag ? "" : no_op);

  add_flag_half(out.full_base_, TrueName.value, flag, true, full_true_help);
  add_flag_half(out.full_base_, FalseName.value, flag, false, full_false_help);

  if (*flag) {
    add_flag_half(out.base_, FalseName.value, flag, false, full_false_help);
  } else {
    add_flag_half(out.base_, TrueName.value, flag, true, full_true_help);
  }
  return out;
}

template <typename StrSeq, util::concepts::IntSequence CharSeq>
template <typename StrSeq2, util::concepts::IntSequence CharSeq2>
auto options_description<StrSeq, CharSeq>::add(const options_description<StrSeq2, CharSeq2>& desc) {
  static_assert(util::no_overlap_v<StrSeq, StrSeq2>, "Options name clash!");
  static_assert(util::no_overlap_v<CharSeq, CharSeq2>, "Options abbreviation clash!");

  using OutT = options_description<util::concat_string_literal_sequence_t<StrSeq, StrSeq2>,
                                   util::concat_int_sequence_t<CharSeq, CharSeq2>>;

  full_base_->add(*desc.full_base_);
  base_->add(*desc.base_);
  return OutT(full_base_, base_);
}

template <typename StrSeq, util::concepts::IntSequence CharSeq>
void options_description<StrSeq, CharSeq>::print(std::ostream& s) const {
  (Settings::help_full ? full_base_ : base_)->print(s);
}

template <typename StrSeq, util::concepts::IntSequence CharSeq>
template <util::StringLiteral Name, char Abbrev>
auto options_description<StrSeq, CharSeq>::augment() const {
  constexpr bool kHasAbbrev = Abbrev != ' ';
  static_assert(!util::string_literal_sequence_contains_v<StrSeq, Name>, "Options name clash!");
  static_assert(!kHasAbbrev || !util::int_sequence_contains_v<CharSeq, int(Abbrev)>,
                "Options abbreviation clash!");

  using StrSeq2 = util::concat_string_literal_sequence_t<StrSeq, util::StringLiteralSequence<Name>>;
  using CharSeq2 = std::conditional_t<
    kHasAbbrev, util::concat_int_sequence_t<CharSeq, util::int_sequence<int(Abbrev)>>, CharSeq>;

  options_description<StrSeq2, CharSeq2> out(full_base_, base_);
  out.tmp_str_ = Name.value;
  if (kHasAbbrev) {
    out.tmp_str_ += ',';
    out.tmp_str_ += Abbrev;
  }
  return out;
}

template <typename StrSeq, util::concepts::IntSequence CharSeq>
void options_description<StrSeq, CharSeq>::add_flag_half(base_t* base, const char* name,
                                                         bool* flag, bool value,
                                                         const std::string& help) {
  namespace po = boost::program_options;
  base->add_options()(name, po::value(flag)->implicit_value(value)->zero_tokens(), help.c_str());
}

namespace detail {

template <typename T>
const T& unwrap(const T& desc) {
  return desc;
}

template <typename S, util::concepts::IntSequence C>
const auto& unwrap(const options_description<S, C>& desc) {
  return desc.get();
}

}  // namespace detail

template <typename T, typename... Ts>
boost::program_options::variables_map parse_args(const T& desc, Ts&&... ts) {
  namespace po = boost::program_options;
  po::variables_map vm;
  try {
    po::store(po::command_line_parser(std::forward<Ts>(ts)...).options(detail::unwrap(desc)).run(),
              vm);
    po::notify(vm);
  } catch (const po::error& e) {
    throw util::CleanException("{}", e.what());
  }
  return vm;
}

}  // namespace program_options

}  // namespace boost_util
