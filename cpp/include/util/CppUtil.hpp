#pragma once

#include <algorithm>
#include <cstddef>
#include <type_traits>
#include <utility>

#define XSTR(a) STR(a)
#define STR(a) #a

/*
 * Evaluates to true iff macro is defined to 1. Meant for build-time switches passed as -DFOO=1,
 * usable in ordinary if statements:
 *
 * if (IS_MACRO_ENABLED(DEBUG_BUILD)) { ... }
 */
#define IS_MACRO_ENABLED(macro) (XSTR(macro)[0] == '1')

namespace util {

/*
 * A string literal usable as a template argument:
 *
 * template <util::StringLiteral S> void foo();
 * foo<"bar">();
 */
template <size_t N>
struct StringLiteral {
  constexpr StringLiteral(const char (&str)[N]) { std::copy_n(str, N, value); }

  template <size_t M>
  constexpr bool operator==(const StringLiteral<M>& other) const {
    return N == M && std::equal(value, value + N, other.value);
  }

  char value[N];
};

template <StringLiteral... Ss>
struct StringLiteralSequence {};

template <int... Ints>
using int_sequence = std::integer_sequence<int, Ints...>;

template <typename T>
struct is_int_sequence : std::false_type {};
template <int... Ints>
struct is_int_sequence<int_sequence<Ints...>> : std::true_type {};
template <typename T>
inline constexpr bool is_int_sequence_v = is_int_sequence<T>::value;

// int_sequence_contains_v<int_sequence<1, 3, 5>, 3> == true
template <typename Seq, int K>
struct int_sequence_contains : std::false_type {};
template <int... Ints, int K>
struct int_sequence_contains<int_sequence<Ints...>, K> : std::bool_constant<((Ints == K) || ...)> {};
template <typename Seq, int K>
inline constexpr bool int_sequence_contains_v = int_sequence_contains<Seq, K>::value;

// string_literal_sequence_contains_v<StringLiteralSequence<"a", "b">, "b"> == true
template <typename Seq, StringLiteral S>
struct string_literal_sequence_contains : std::false_type {};
template <StringLiteral... Ss, StringLiteral S>
struct string_literal_sequence_contains<StringLiteralSequence<Ss...>, S>
    : std::bool_constant<((Ss == S) || ...)> {};
template <typename Seq, StringLiteral S>
inline constexpr bool string_literal_sequence_contains_v =
  string_literal_sequence_contains<Seq, S>::value;

template <typename Seq1, typename Seq2>
struct concat_int_sequence {};
template <int... Ints1, int... Ints2>
struct concat_int_sequence<int_sequence<Ints1...>, int_sequence<Ints2...>> {
  using type = int_sequence<Ints1..., Ints2...>;
};
template <typename Seq1, typename Seq2>
using concat_int_sequence_t = typename concat_int_sequence<Seq1, Seq2>::type;

template <typename Seq1, typename Seq2>
struct concat_string_literal_sequence {};
template <StringLiteral... Ss1, StringLiteral... Ss2>
struct concat_string_literal_sequence<StringLiteralSequence<Ss1...>, StringLiteralSequence<Ss2...>> {
  using type = StringLiteralSequence<Ss1..., Ss2...>;
};
template <typename Seq1, typename Seq2>
using concat_string_literal_sequence_t = typename concat_string_literal_sequence<Seq1, Seq2>::type;

/*
 * no_overlap_v<Seq1, Seq2> is true iff Seq1 and Seq2 share no element. Both must be
 * int_sequence's, or both StringLiteralSequence's.
 */
template <typename Seq1, typename Seq2>
struct no_overlap : std::true_type {};
template <typename Seq1, int... Ints>
struct no_overlap<Seq1, int_sequence<Ints...>>
    : std::bool_constant<(!int_sequence_contains_v<Seq1, Ints> && ...)> {};
template <typename Seq1, StringLiteral... Ss>
struct no_overlap<Seq1, StringLiteralSequence<Ss...>>
    : std::bool_constant<(!string_literal_sequence_contains_v<Seq1, Ss> && ...)> {};
template <typename Seq1, typename Seq2>
inline constexpr bool no_overlap_v = no_overlap<Seq1, Seq2>::value;

namespace concepts {

template <typename T>
concept IntSequence = is_int_sequence_v<T>;

}  // namespace concepts

}  // namespace util
