#pragma once

#include <string>
#include <glib.h>

class Base64 {
public:
    // curl 출력은 바이너리일 수 있으므로 std::string 을 바이트 버퍼로 다룬다
    static std::string encode(const std::string& data) {
        if (data.empty()) return "";

        gchar* encoded = g_base64_encode(
            reinterpret_cast<const guchar*>(data.data()), data.size());
        std::string result(encoded);
        g_free(encoded);

        return result;
    }

    static std::string decode(const std::string& encoded) {
        if (encoded.empty()) return "";

        gsize len = 0;
        guchar* decoded = g_base64_decode(encoded.c_str(), &len);
        std::string result(reinterpret_cast<const char*>(decoded), len);
        g_free(decoded);

        return result;
    }
};
