#pragma once

#include <string_view>

namespace EnumFusion {


enum class ParseError {
    NO_ERROR,

    NON_MAP_IN_ENUM_MAP,
    UNKNOWN_KEY,
    KEY_NOT_SPECIFIED,

    NON_NUMERIC_IN_NUMERIC_STORAGE,
    NON_BOOL_IN_BOOL_VALUE,
    NON_STRING_IN_STRING_STORAGE,
    NULL_IN_NON_OPTIONAL,
    ILLFORMED_KEY_VALUE,

    READER_ERROR
};

constexpr std::string_view error_to_string(ParseError e) {
    switch(e) {
    case ParseError::NO_ERROR: return "NO_ERROR"; break;
    case ParseError::NON_MAP_IN_ENUM_MAP: return "NON_MAP_IN_ENUM_MAP"; break;
    case ParseError::UNKNOWN_KEY: return "UNKNOWN_KEY"; break;
    // The missing-key message is part of the observable contract; callers match on its text.
    case ParseError::KEY_NOT_SPECIFIED: return "key not specified"; break;
    case ParseError::NON_NUMERIC_IN_NUMERIC_STORAGE: return "NON_NUMERIC_IN_NUMERIC_STORAGE"; break;
    case ParseError::NON_BOOL_IN_BOOL_VALUE: return "NON_BOOL_IN_BOOL_VALUE"; break;
    case ParseError::NON_STRING_IN_STRING_STORAGE: return "NON_STRING_IN_STRING_STORAGE"; break;
    case ParseError::NULL_IN_NON_OPTIONAL: return "NULL_IN_NON_OPTIONAL"; break;
    case ParseError::ILLFORMED_KEY_VALUE: return "ILLFORMED_KEY_VALUE"; break;
    case ParseError::READER_ERROR: return "READER_ERROR"; break;
    }
    return "N/A";
}


enum class SerializeError {
    NO_ERROR,
    WRITER_ERROR
};

constexpr std::string_view error_to_string(SerializeError e) {
    switch(e) {
    case SerializeError::NO_ERROR: return "NO_ERROR"; break;
    case SerializeError::WRITER_ERROR: return "WRITER_ERROR"; break;
    }
    return "N/A";
}


enum class ArbitraryError {
    NO_ERROR,
    NOT_ENOUGH_DATA
};

constexpr std::string_view error_to_string(ArbitraryError e) {
    switch(e) {
    case ArbitraryError::NO_ERROR: return "NO_ERROR"; break;
    case ArbitraryError::NOT_ENOUGH_DATA: return "NOT_ENOUGH_DATA"; break;
    }
    return "N/A";
}

} // namespace EnumFusion
