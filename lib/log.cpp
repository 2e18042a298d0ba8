// log.cpp - zlog-compatible logging for mdlint
//
// Categories live in a fixed table and are never removed, so the pointers
// handed out by log_get_category() stay valid for the life of the process,
// across log_init() and log_fini(). All state is guarded by one mutex; the
// reflow engine may log from several threads at once. A category's level
// and enabled flag are also read without the mutex to drop filtered
// messages early, so they are only stored with relaxed atomics.

#include "log.h"
#include <string.h>
#include <strings.h>
#include <ctype.h>
#include <mutex>

static log_category_t log_categories[LOG_MAX_CATEGORIES];
static int log_category_count = 0;
static int log_global_level = LOG_LEVEL_INFO;
static std::mutex log_mutex;

log_category_t *log_default_category = NULL;

static inline void store_relaxed(int* field, int value) {
    __atomic_store_n(field, value, __ATOMIC_RELAXED);
}

static inline int load_relaxed(const int* field) {
    return __atomic_load_n(field, __ATOMIC_RELAXED);
}

// ============================================================================
// Category table (callers hold log_mutex)
// ============================================================================

static log_category_t* find_category_locked(const char* name) {
    for (int i = 0; i < log_category_count; i++) {
        if (strcmp(log_categories[i].name, name) == 0) return &log_categories[i];
    }
    return NULL;
}

static log_category_t* add_category_locked(const char* name) {
    log_category_t* cat = find_category_locked(name);
    if (cat) return cat;
    if (log_category_count >= LOG_MAX_CATEGORIES) return NULL;
    cat = &log_categories[log_category_count++];
    strncpy(cat->name, name, sizeof(cat->name) - 1);
    cat->name[sizeof(cat->name) - 1] = '\0';
    store_relaxed(&cat->level, log_global_level);
    cat->output = NULL;
    store_relaxed(&cat->enabled, 1);
    return cat;
}

static log_category_t* default_category_locked() {
    if (!log_default_category) {
        log_default_category = add_category_locked("default");
    }
    return log_default_category;
}

// ============================================================================
// Level names
// ============================================================================

const char* log_level_to_string(int level) {
    if (level >= LOG_LEVEL_FATAL) return "FATAL";
    if (level >= LOG_LEVEL_ERROR) return "ERROR";
    if (level >= LOG_LEVEL_WARN) return "WARN";
    if (level >= LOG_LEVEL_NOTICE) return "NOTICE";
    if (level >= LOG_LEVEL_INFO) return "INFO";
    return "DEBUG";
}

int log_level_from_string(const char *name) {
    if (!name) return -1;
    if (strcasecmp(name, "debug") == 0) return LOG_LEVEL_DEBUG;
    if (strcasecmp(name, "info") == 0) return LOG_LEVEL_INFO;
    if (strcasecmp(name, "notice") == 0) return LOG_LEVEL_NOTICE;
    if (strcasecmp(name, "warn") == 0 || strcasecmp(name, "warning") == 0) return LOG_LEVEL_WARN;
    if (strcasecmp(name, "error") == 0) return LOG_LEVEL_ERROR;
    if (strcasecmp(name, "fatal") == 0) return LOG_LEVEL_FATAL;
    return -1;
}

// ============================================================================
// Configuration
// ============================================================================

static void trim_copy(char* dst, size_t cap, const char* begin, const char* end) {
    while (begin < end && isspace((unsigned char)*begin)) begin++;
    while (end > begin && isspace((unsigned char)end[-1])) end--;
    size_t n = (size_t)(end - begin);
    if (n >= cap) n = cap - 1;
    memcpy(dst, begin, n);
    dst[n] = '\0';
}

static int parse_config_locked(const char* config) {
    const char* pos = config;
    while (*pos) {
        const char* stop = strchr(pos, ';');
        if (!stop) stop = pos + strlen(pos);

        char entry[128];
        trim_copy(entry, sizeof(entry), pos, stop);
        pos = *stop ? stop + 1 : stop;
        if (!entry[0]) continue;

        char* eq = strchr(entry, '=');
        if (!eq) {
            // bare level applies to every category
            int level = log_level_from_string(entry);
            if (level < 0) return LOG_WRONG_FORMAT;
            log_global_level = level;
            for (int i = 0; i < log_category_count; i++) store_relaxed(&log_categories[i].level, level);
            continue;
        }

        *eq = '\0';
        char name[64], value[64];
        trim_copy(name, sizeof(name), entry, eq);
        trim_copy(value, sizeof(value), eq + 1, eq + 1 + strlen(eq + 1));
        int level = log_level_from_string(value);
        if (!name[0] || level < 0) return LOG_WRONG_FORMAT;
        log_category_t* cat = add_category_locked(name);
        if (!cat) return LOG_CATEGORY_NOT_FOUND;
        store_relaxed(&cat->level, level);
    }
    return LOG_OK;
}

int log_parse_config_string(const char *config) {
    if (!config) return LOG_OK;
    std::lock_guard<std::mutex> lock(log_mutex);
    default_category_locked();
    return parse_config_locked(config);
}

static void reset_categories_locked() {
    log_global_level = LOG_LEVEL_INFO;
    for (int i = 0; i < log_category_count; i++) {
        store_relaxed(&log_categories[i].level, LOG_LEVEL_INFO);
        log_categories[i].output = NULL;
        store_relaxed(&log_categories[i].enabled, 1);
    }
}

int log_init(const char *config) {
    std::lock_guard<std::mutex> lock(log_mutex);
    reset_categories_locked();
    default_category_locked();
    if (!config || !*config) return LOG_OK;
    return parse_config_locked(config);
}

void log_fini(void) {
    std::lock_guard<std::mutex> lock(log_mutex);
    for (int i = 0; i < log_category_count; i++) {
        FILE* out = log_categories[i].output;
        if (out) fflush(out);
    }
    fflush(stderr);
    reset_categories_locked();
}

log_category_t* log_get_category(const char *cname) {
    if (!cname || !*cname) return NULL;
    std::lock_guard<std::mutex> lock(log_mutex);
    default_category_locked();
    log_category_t* cat = add_category_locked(cname);
    return cat ? cat : log_default_category;
}

// ============================================================================
// Level control
// ============================================================================

int log_level_enabled(log_category_t *category, const int level) {
    std::lock_guard<std::mutex> lock(log_mutex);
    log_category_t* cat = category ? category : default_category_locked();
    return cat && cat->enabled && level >= cat->level;
}

void log_set_level(log_category_t *category, int level) {
    std::lock_guard<std::mutex> lock(log_mutex);
    log_category_t* cat = category ? category : default_category_locked();
    if (cat) store_relaxed(&cat->level, level);
}

void log_set_output(log_category_t *category, FILE *output) {
    std::lock_guard<std::mutex> lock(log_mutex);
    log_category_t* cat = category ? category : default_category_locked();
    if (cat) cat->output = output;
}

// ============================================================================
// Writers
// ============================================================================

static bool filtered(const log_category_t* cat, int level) {
    return !load_relaxed(&cat->enabled) || level < load_relaxed(&cat->level);
}

int clog_vlog(log_category_t *category, int level, const char *format, va_list args) {
    if (category && filtered(category, level)) return LOG_OK;

    std::lock_guard<std::mutex> lock(log_mutex);
    log_category_t* cat = category ? category : default_category_locked();
    if (!cat) return LOG_CATEGORY_NOT_FOUND;
    if (filtered(cat, level)) return LOG_OK;

    FILE* out = cat->output ? cat->output : stderr;
    if (fprintf(out, "[%s] %s: ", log_level_to_string(level), cat->name) < 0) return LOG_WRITE_FAIL;
    if (vfprintf(out, format, args) < 0) return LOG_WRITE_FAIL;
    if (fputc('\n', out) == EOF) return LOG_WRITE_FAIL;
    return LOG_OK;
}

#define LOG_FORWARD(cat, level) \
    va_list args; \
    va_start(args, format); \
    int rc = clog_vlog(cat, level, format, args); \
    va_end(args); \
    return rc;

int clog_error(log_category_t *category, const char *format, ...) { LOG_FORWARD(category, LOG_LEVEL_ERROR) }
int clog_warn(log_category_t *category, const char *format, ...) { LOG_FORWARD(category, LOG_LEVEL_WARN) }
int clog_info(log_category_t *category, const char *format, ...) { LOG_FORWARD(category, LOG_LEVEL_INFO) }
int clog_debug(log_category_t *category, const char *format, ...) { LOG_FORWARD(category, LOG_LEVEL_DEBUG) }

int log_error(const char *format, ...) { LOG_FORWARD(NULL, LOG_LEVEL_ERROR) }
int log_warn(const char *format, ...) { LOG_FORWARD(NULL, LOG_LEVEL_WARN) }
int log_info(const char *format, ...) { LOG_FORWARD(NULL, LOG_LEVEL_INFO) }
int log_debug(const char *format, ...) { LOG_FORWARD(NULL, LOG_LEVEL_DEBUG) }
