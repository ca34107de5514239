#ifndef SPARKBRIDGE_MACROS_HPP
#define SPARKBRIDGE_MACROS_HPP

#define SPARKBRIDGE_EXPAND(...) __VA_ARGS__

#define SPARKBRIDGE_CONCAT_IMPL(A, B) A##_##B
#define SPARKBRIDGE_CONCAT(A, B) SPARKBRIDGE_CONCAT_IMPL(A, B)

#define SPARKBRIDGE_REVERSE_SEQ_N() 10, 9, 8, 7, 6, 5, 4, 3, 2, 1, 0

#define SPARKBRIDGE_SEQ_N(_1, _2, _3, _4, _5, _6, _7, _8, _9, _10, N, ...) N

#define SPARKBRIDGE_GET_ARG_IMPL(...) SPARKBRIDGE_EXPAND(SPARKBRIDGE_SEQ_N(__VA_ARGS__))
#define SPARKBRIDGE_GET_ARG_N(...) SPARKBRIDGE_GET_ARG_IMPL(__VA_ARGS__, SPARKBRIDGE_REVERSE_SEQ_N())

#define SPARKBRIDGE_AR_LIST_1(m) ar & m
#define SPARKBRIDGE_AR_LIST_2(m, ...) ar & m; SPARKBRIDGE_EXPAND(SPARKBRIDGE_AR_LIST_1(__VA_ARGS__))
#define SPARKBRIDGE_AR_LIST_3(m, ...) ar & m; SPARKBRIDGE_EXPAND(SPARKBRIDGE_AR_LIST_2(__VA_ARGS__))
#define SPARKBRIDGE_AR_LIST_4(m, ...) ar & m; SPARKBRIDGE_EXPAND(SPARKBRIDGE_AR_LIST_3(__VA_ARGS__))
#define SPARKBRIDGE_AR_LIST_5(m, ...) ar & m; SPARKBRIDGE_EXPAND(SPARKBRIDGE_AR_LIST_4(__VA_ARGS__))
#define SPARKBRIDGE_AR_LIST_6(m, ...) ar & m; SPARKBRIDGE_EXPAND(SPARKBRIDGE_AR_LIST_5(__VA_ARGS__))
#define SPARKBRIDGE_AR_LIST_7(m, ...) ar & m; SPARKBRIDGE_EXPAND(SPARKBRIDGE_AR_LIST_6(__VA_ARGS__))
#define SPARKBRIDGE_AR_LIST_8(m, ...) ar & m; SPARKBRIDGE_EXPAND(SPARKBRIDGE_AR_LIST_7(__VA_ARGS__))
#define SPARKBRIDGE_AR_LIST_9(m, ...) ar & m; SPARKBRIDGE_EXPAND(SPARKBRIDGE_AR_LIST_8(__VA_ARGS__))
#define SPARKBRIDGE_AR_LIST_10(m, ...) ar & m; SPARKBRIDGE_EXPAND(SPARKBRIDGE_AR_LIST_9(__VA_ARGS__))

#define SPARKBRIDGE_AR_LIST(N, ...) SPARKBRIDGE_EXPAND(SPARKBRIDGE_CONCAT(SPARKBRIDGE_AR_LIST, N)(__VA_ARGS__))

/// Makes a user type usable with the plain serializer:
///
///     struct Point {
///         int x, y;
///         SPARKBRIDGE_SERIALIZE_MEMBERS(x, y);
///     };
#define SPARKBRIDGE_SERIALIZE_MEMBERS(...) \
friend class boost::serialization::access; \
template <class Archive> \
void serialize(Archive& ar, const unsigned int) { \
    SPARKBRIDGE_AR_LIST(SPARKBRIDGE_GET_ARG_N(__VA_ARGS__), __VA_ARGS__); \
} \

#endif //SPARKBRIDGE_MACROS_HPP
