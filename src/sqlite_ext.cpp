#include <sqlite3ext.h>
SQLITE_EXTENSION_INIT1

#include "sqlite_ext.hpp"
#include "context.hpp"
#include "errors.hpp"
#include "http.hpp"
#include "plugin.hpp"
#include "util.hpp"
#include <nlohmann/json.hpp>
#include <cstring>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// Older headers lack the flag; the bit is stable.
#ifndef SQLITE_RESULT_SUBTYPE
#define SQLITE_RESULT_SUBTYPE 0x001000000
#endif

using json = nlohmann::json;

namespace {

rembed::Context& context_of(sqlite3_context* ctx) {
    return *static_cast<rembed::Context*>(sqlite3_user_data(ctx));
}

// Exceptions must not cross back into SQLite
template <typename F>
void guarded(sqlite3_context* ctx, F body) {
    try {
        body();
    } catch (const std::exception& e) {
        sqlite3_result_error(ctx, e.what(), -1);
    } catch (...) {
        sqlite3_result_error(ctx, "rembed: unknown error", -1);
    }
}

std::string text_arg(sqlite3_value* value, const char* what) {
    const auto* text = sqlite3_value_text(value);
    if (!text) {
        throw std::invalid_argument(std::string(what) + " must be text");
    }
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<size_t>(sqlite3_value_bytes(value)));
}

std::string blob_arg(sqlite3_value* value, const char* what) {
    if (sqlite3_value_type(value) != SQLITE_BLOB) {
        throw std::invalid_argument(std::string(what) + " must be a blob");
    }
    const auto* data = static_cast<const char*>(sqlite3_value_blob(value));
    int size = sqlite3_value_bytes(value);
    return data ? std::string(data, static_cast<size_t>(size)) : std::string();
}

void result_vector(sqlite3_context* ctx, const rembed::Embedding& embedding) {
    std::string blob = rembed::floats_to_blob(embedding);
    sqlite3_result_blob(ctx, blob.data(), static_cast<int>(blob.size()), SQLITE_TRANSIENT);
    sqlite3_result_subtype(ctx, REMBED_FLOAT32_SUBTYPE);
}

void result_json(sqlite3_context* ctx, const json& j) {
    std::string text = j.dump();
    sqlite3_result_text(ctx, text.c_str(), static_cast<int>(text.size()), SQLITE_TRANSIENT);
}

json parse_json_array(const std::string& text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        throw std::invalid_argument(std::string("Invalid JSON array: ") + e.what());
    }
    if (!j.is_array()) {
        throw std::invalid_argument("Invalid JSON array: expected an array");
    }
    return j;
}

// ── Scalar functions ────────────────────────────────────────────

void fn_version(sqlite3_context* ctx, int, sqlite3_value**) {
    sqlite3_result_text(ctx, "v" REMBED_VERSION, -1, SQLITE_STATIC);
}

void fn_debug(sqlite3_context* ctx, int, sqlite3_value**) {
    guarded(ctx, [&] {
        auto& context = context_of(ctx);
        std::string providers;
        for (const auto& name : rembed::PluginRegistry::instance().provider_names()) {
            if (!providers.empty()) providers += ", ";
            providers += name;
        }
        std::string text =
            "Version: v" REMBED_VERSION "\n"
            "Workers: " + std::to_string(context.bridge().worker_count()) + "\n"
            "HTTP: " + rembed::http_backend_version() + "\n"
            "Providers: " + providers + "\n";
        sqlite3_result_text(ctx, text.c_str(), static_cast<int>(text.size()), SQLITE_TRANSIENT);
    });
}

void free_client_options(void* p) {
    delete static_cast<rembed::ClientOptions*>(p);
}

void fn_client_options(sqlite3_context* ctx, int argc, sqlite3_value** argv) {
    guarded(ctx, [&] {
        if (argc % 2 != 0) {
            throw std::invalid_argument(
                "Must have an even number of arguments to rembed_client_options, "
                "as key/value pairs.");
        }
        auto options = std::make_unique<rembed::ClientOptions>();
        for (int i = 0; i < argc; i += 2) {
            (*options)[text_arg(argv[i], "option key")] = text_arg(argv[i + 1], "option value");
        }
        if (!options->count("model") && !options->count("format") &&
            !options->count("provider")) {
            throw std::invalid_argument("'model' or 'format' key is required");
        }
        sqlite3_result_pointer(ctx, options.release(), REMBED_CLIENT_OPTIONS_POINTER,
                               free_client_options);
    });
}

// rembed(name, text [, input_type]); the input type is accepted and ignored
void fn_rembed(sqlite3_context* ctx, int, sqlite3_value** argv) {
    guarded(ctx, [&] {
        auto name = text_arg(argv[0], "client name");
        auto input = text_arg(argv[1], "input");
        result_vector(ctx, context_of(ctx).embed_one(name, input));
    });
}

void fn_rembed_batch(sqlite3_context* ctx, int, sqlite3_value** argv) {
    guarded(ctx, [&] {
        auto name = text_arg(argv[0], "client name");
        auto arr = parse_json_array(text_arg(argv[1], "input"));
        std::vector<std::string> texts;
        texts.reserve(arr.size());
        for (const auto& item : arr) {
            if (!item.is_string()) {
                throw std::invalid_argument("Invalid JSON array: expected strings");
            }
            texts.push_back(item.get<std::string>());
        }
        json out = json::array();
        for (const auto& embedding : context_of(ctx).embed_many(name, texts)) {
            out.push_back(rembed::base64_encode(rembed::floats_to_blob(embedding)));
        }
        result_json(ctx, out);
    });
}

void fn_rembed_image(sqlite3_context* ctx, int argc, sqlite3_value** argv) {
    guarded(ctx, [&] {
        auto name = text_arg(argv[0], "client name");
        auto image = blob_arg(argv[1], "image");
        std::optional<std::string> prompt;
        if (argc > 2) prompt = text_arg(argv[2], "prompt");
        result_vector(ctx, context_of(ctx).embed_image(name, image, prompt));
    });
}

void fn_rembed_images_concurrent(sqlite3_context* ctx, int, sqlite3_value** argv) {
    guarded(ctx, [&] {
        auto name = text_arg(argv[0], "client name");
        auto arr = parse_json_array(text_arg(argv[1], "images"));
        std::vector<std::string> images;
        images.reserve(arr.size());
        for (const auto& item : arr) {
            if (!item.is_string()) {
                throw std::invalid_argument("Invalid JSON array: expected base64 strings");
            }
            try {
                images.push_back(rembed::base64_decode(item.get<std::string>()));
            } catch (const std::invalid_argument& e) {
                throw std::invalid_argument("image " + std::to_string(images.size()) +
                                            ": " + e.what());
            }
        }
        result_json(ctx, rembed::to_json(context_of(ctx).process_multimodal(name,
                                                                            std::move(images))));
    });
}

// ── rembed_clients virtual table ────────────────────────────────

struct ClientsTable {
    sqlite3_vtab base;
    rembed::Context* context;
};

struct ClientsCursor {
    sqlite3_vtab_cursor base;
    std::vector<std::pair<std::string, std::string>> rows;  // name, descriptor JSON
    size_t pos = 0;
};

void set_vtab_error(sqlite3_vtab* vtab, const std::string& message) {
    sqlite3_free(vtab->zErrMsg);
    vtab->zErrMsg = sqlite3_mprintf("%s", message.c_str());
}

int clients_connect(sqlite3* db, void* aux, int, const char* const*,
                    sqlite3_vtab** out, char**) {
    int rc = sqlite3_declare_vtab(db, "CREATE TABLE x(name TEXT, options)");
    if (rc != SQLITE_OK) return rc;
    auto* table = new ClientsTable();
    table->context = static_cast<rembed::Context*>(aux);
    *out = &table->base;
    return SQLITE_OK;
}

int clients_disconnect(sqlite3_vtab* vtab) {
    delete reinterpret_cast<ClientsTable*>(vtab);
    return SQLITE_OK;
}

int clients_best_index(sqlite3_vtab*, sqlite3_index_info* info) {
    info->estimatedCost = 10000.0;
    info->estimatedRows = 10000;
    return SQLITE_OK;
}

int clients_open(sqlite3_vtab*, sqlite3_vtab_cursor** out) {
    auto* cursor = new ClientsCursor();
    *out = &cursor->base;
    return SQLITE_OK;
}

int clients_close(sqlite3_vtab_cursor* cur) {
    delete reinterpret_cast<ClientsCursor*>(cur);
    return SQLITE_OK;
}

int clients_filter(sqlite3_vtab_cursor* cur, int, const char*, int, sqlite3_value**) {
    auto* cursor = reinterpret_cast<ClientsCursor*>(cur);
    auto* table = reinterpret_cast<ClientsTable*>(cur->pVtab);
    cursor->rows.clear();
    cursor->pos = 0;
    try {
        for (const auto& name : table->context->client_names()) {
            cursor->rows.emplace_back(name, table->context->describe_client(name).dump());
        }
    } catch (const std::exception& e) {
        set_vtab_error(cur->pVtab, e.what());
        return SQLITE_ERROR;
    }
    return SQLITE_OK;
}

int clients_next(sqlite3_vtab_cursor* cur) {
    reinterpret_cast<ClientsCursor*>(cur)->pos++;
    return SQLITE_OK;
}

int clients_eof(sqlite3_vtab_cursor* cur) {
    auto* cursor = reinterpret_cast<ClientsCursor*>(cur);
    return cursor->pos >= cursor->rows.size();
}

int clients_column(sqlite3_vtab_cursor* cur, sqlite3_context* ctx, int column) {
    auto* cursor = reinterpret_cast<ClientsCursor*>(cur);
    const auto& row = cursor->rows[cursor->pos];
    const std::string& value = column == 0 ? row.first : row.second;
    sqlite3_result_text(ctx, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
    return SQLITE_OK;
}

int clients_rowid(sqlite3_vtab_cursor* cur, sqlite3_int64* rowid) {
    *rowid = static_cast<sqlite3_int64>(reinterpret_cast<ClientsCursor*>(cur)->pos);
    return SQLITE_OK;
}

// argc == 1 is DELETE; a non-NULL argv[0] is UPDATE; otherwise INSERT
// with argv[2] = name and argv[3] = options.
int clients_update(sqlite3_vtab* vtab, int argc, sqlite3_value** argv, sqlite3_int64* rowid) {
    if (argc == 1) {
        set_vtab_error(vtab, "DELETE operations on rembed_clients are not supported");
        return SQLITE_ERROR;
    }
    if (sqlite3_value_type(argv[0]) != SQLITE_NULL) {
        set_vtab_error(vtab, "UPDATE operations on rembed_clients are not supported");
        return SQLITE_ERROR;
    }
    auto* table = reinterpret_cast<ClientsTable*>(vtab);
    try {
        std::string name = text_arg(argv[2], "client name");
        rembed::ConfigInput input;
        if (sqlite3_value_type(argv[3]) == SQLITE_TEXT) {
            input = text_arg(argv[3], "options");
        } else if (auto* options = static_cast<rembed::ClientOptions*>(
                       sqlite3_value_pointer(argv[3], REMBED_CLIENT_OPTIONS_POINTER))) {
            input = *options;
        } else {
            throw std::invalid_argument("client options required");
        }
        table->context->register_client(name, input);
        *rowid = static_cast<sqlite3_int64>(table->context->client_names().size());
    } catch (const std::exception& e) {
        set_vtab_error(vtab, e.what());
        return SQLITE_ERROR;
    }
    return SQLITE_OK;
}

sqlite3_module make_clients_module() {
    sqlite3_module m;
    std::memset(&m, 0, sizeof(m));
    m.xCreate = clients_connect;
    m.xConnect = clients_connect;
    m.xBestIndex = clients_best_index;
    m.xDisconnect = clients_disconnect;
    m.xDestroy = clients_disconnect;
    m.xOpen = clients_open;
    m.xClose = clients_close;
    m.xFilter = clients_filter;
    m.xNext = clients_next;
    m.xEof = clients_eof;
    m.xColumn = clients_column;
    m.xRowid = clients_rowid;
    m.xUpdate = clients_update;
    return m;
}

void destroy_context(void* p) {
    delete static_cast<rembed::Context*>(p);
}

struct FunctionDef {
    const char* name;
    int argc;
    int flags;
    void (*fn)(sqlite3_context*, int, sqlite3_value**);
};

} // namespace

extern "C" int sqlite3_rembed_init(sqlite3* db, char** pzErrMsg,
                                   const sqlite3_api_routines* pApi) {
    SQLITE_EXTENSION_INIT2(pApi);

    rembed::Context* context = nullptr;
    try {
        context = new rembed::Context(rembed::Config::load());
    } catch (const std::exception& e) {
        if (pzErrMsg) *pzErrMsg = sqlite3_mprintf("rembed: %s", e.what());
        return SQLITE_ERROR;
    }

    static const sqlite3_module clients_module = make_clients_module();
    // The module owns the context from here on, even on failure.
    int rc = sqlite3_create_module_v2(db, "rembed_clients", &clients_module, context,
                                      destroy_context);
    if (rc != SQLITE_OK) return rc;

    constexpr int kPure = SQLITE_UTF8 | SQLITE_DETERMINISTIC;
    constexpr int kVector = SQLITE_UTF8 | SQLITE_RESULT_SUBTYPE;
    static const FunctionDef kFunctions[] = {
        {"rembed_version",           0,  kPure,       fn_version},
        {"rembed_debug",             0,  SQLITE_UTF8, fn_debug},
        {"rembed_client_options",    -1, SQLITE_UTF8, fn_client_options},
        {"rembed",                   2,  kVector,     fn_rembed},
        {"rembed",                   3,  kVector,     fn_rembed},
        {"rembed_batch",             2,  SQLITE_UTF8, fn_rembed_batch},
        {"rembed_image",             2,  kVector,     fn_rembed_image},
        {"rembed_image_prompt",      3,  kVector,     fn_rembed_image},
        {"rembed_images_concurrent", 2,  SQLITE_UTF8, fn_rembed_images_concurrent},
    };
    for (const auto& f : kFunctions) {
        rc = sqlite3_create_function_v2(db, f.name, f.argc, f.flags, context,
                                        f.fn, nullptr, nullptr, nullptr);
        if (rc != SQLITE_OK) {
            if (pzErrMsg) {
                *pzErrMsg = sqlite3_mprintf("rembed: failed to register %s", f.name);
            }
            return rc;
        }
    }
    return SQLITE_OK;
}
