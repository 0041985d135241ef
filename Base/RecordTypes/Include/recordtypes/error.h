#ifndef recordtypes_ERROR_H
#define recordtypes_ERROR_H

#include <string>
#include <utility>

namespace recordtypes {

    // 错误码枚举
    enum class ErrorCode {
        Ok = 0,
        // 文本按布局解析失败
        ParseError,
        // 数据库驱动返回了不支持的值类型
        ScanTypeError,
        // JSON 形状或类型不符
        DecodeError,
    };

    inline const char *errorCodeName(ErrorCode code) {
        switch (code) {
            case ErrorCode::Ok:
                return "Ok";
            case ErrorCode::ParseError:
                return "ParseError";
            case ErrorCode::ScanTypeError:
                return "ScanTypeError";
            case ErrorCode::DecodeError:
                return "DecodeError";
        }
        return "Unknown";
    }

    // Error 结构体，用于封装错误信息
    struct Error {
        ErrorCode code = ErrorCode::Ok;
        std::string message;

        Error() = default;
        Error(ErrorCode c, std::string msg = "") : code(c), message(std::move(msg)) {
        }

        bool isOk() const {
            return code == ErrorCode::Ok;
        }

        // 允许在布尔上下文中使用 (if (error))
        explicit operator bool() const {
            return !isOk();  // true if there is an error
        }

        std::string toString() const {
            std::string err_str = std::string(errorCodeName(code));
            if (!message.empty()) {
                err_str += ": " + message;
            }
            return err_str;
        }
    };

}  // namespace recordtypes

#endif  // recordtypes_ERROR_H
