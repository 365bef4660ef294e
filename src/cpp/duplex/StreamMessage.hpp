#pragma once

#include <string>

#include "basic_types.hpp"

namespace duplex {
    /** What a worker thread reports about its stream. */
    struct StreamMessage {
        enum class Kind : int {
            data,   ///< bytes read from cout/cerr
            eof,    ///< stream finished, cin fully written or EOF on output
            error   ///< stream failed with error_code, the worker is done
        };

        Kind        kind        = Kind::eof;
        StreamId    stream      = StreamId::cout;
        std::string data;
        int         error_code  = 0;

        static StreamMessage make_data(StreamId stream, std::string data) {
            StreamMessage message;
            message.kind = Kind::data;
            message.stream = stream;
            message.data = std::move(data);
            return message;
        }
        static StreamMessage make_eof(StreamId stream) {
            StreamMessage message;
            message.kind = Kind::eof;
            message.stream = stream;
            return message;
        }
        static StreamMessage make_error(StreamId stream, int error_code) {
            StreamMessage message;
            message.kind = Kind::error;
            message.stream = stream;
            message.error_code = error_code;
            return message;
        }
    };
}
