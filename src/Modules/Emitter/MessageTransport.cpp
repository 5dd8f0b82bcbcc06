/**
 * @file MessageTransport.cpp
 * @brief Stdout, file and HTTP transports.
 */
#include "MessageTransport.h"

#include <curl/curl.h>
#include <stdio.h>

#define LOG_TAG "Transp"
#include "Core/ModuleLog.h"

namespace {

bool writeLine_(FILE* f, const char* payload, size_t len)
{
    if (fwrite(payload, 1, len, f) != len) return false;
    if (fputc('\n', f) == EOF) return false;
    return fflush(f) == 0;
}

bool sendStdout_(void*, const char* payload, size_t len)
{
    if (!payload) return false;
    return writeLine_(stdout, payload, len);
}

bool sendFile_(void* ctx, const char* payload, size_t len)
{
    MessageTransports::FileTarget* target = static_cast<MessageTransports::FileTarget*>(ctx);
    if (!target || !payload || target->path[0] == '\0') return false;

    FILE* f = fopen(target->path, "a");
    if (!f) {
        LOGW("cannot open %s", target->path);
        return false;
    }
    const bool ok = writeLine_(f, payload, len);
    if (fclose(f) != 0) return false;
    return ok;
}

bool curlReady_()
{
    static bool tried = false;
    static bool ready = false;
    if (!tried) {
        tried = true;
        ready = (curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK);
        if (!ready) LOGE("curl_global_init failed");
    }
    return ready;
}

size_t discardBody_(char*, size_t size, size_t nmemb, void*)
{
    return size * nmemb;
}

bool sendHttp_(void* ctx, const char* payload, size_t len)
{
    MessageTransports::HttpTarget* target = static_cast<MessageTransports::HttpTarget*>(ctx);
    if (!target || !payload || target->url[0] == '\0') return false;

    ++target->attempts;
    target->lastStatus = 0;
    if (!curlReady_()) return false;

    CURL* curl = curl_easy_init();
    if (!curl) {
        LOGE("curl_easy_init failed");
        return false;
    }

    struct curl_slist* headers = curl_slist_append(nullptr, "Content-Type: application/json");
    curl_easy_setopt(curl, CURLOPT_URL, target->url);
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, payload);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, (curl_off_t)len);
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, target->timeoutMs);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &discardBody_);

    const CURLcode rc = curl_easy_perform(curl);
    bool ok = false;
    if (rc != CURLE_OK) {
        LOGW("POST %s failed: %s", target->url, curl_easy_strerror(rc));
    } else {
        long status = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
        target->lastStatus = status;
        ok = (status >= 200 && status < 300);
        if (!ok) LOGW("POST %s: http %ld", target->url, status);
    }

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);
    return ok;
}

}  // namespace

namespace MessageTransports {

MessageTransport stdoutTransport()
{
    MessageTransport t;
    t.send = &sendStdout_;
    t.ctx = nullptr;
    return t;
}

MessageTransport fileTransport(FileTarget& target)
{
    MessageTransport t;
    t.send = &sendFile_;
    t.ctx = &target;
    return t;
}

MessageTransport httpTransport(HttpTarget& target)
{
    MessageTransport t;
    t.send = &sendHttp_;
    t.ctx = &target;
    return t;
}

}  // namespace MessageTransports
