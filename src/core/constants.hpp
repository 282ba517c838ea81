#pragma once

#include <cstddef>
#include <cstdint>

// ── Defaults ────────────────────────────────────────────────
constexpr const char* DEFAULT_NEXUS_URL      = "http://localhost:8081";
constexpr const char* DEFAULT_NEXUS_USER     = "admin";
constexpr const char* DEFAULT_NEXUS_PASS     = "admin";
constexpr const char* DEFAULT_CHECKSUM       = "sha1";
constexpr int DEFAULT_PARALLELISM            = 8;

// ── Environment variables ───────────────────────────────────
constexpr const char* ENV_NEXUS_URL          = "NEXUS_URL";
constexpr const char* ENV_NEXUS_USER         = "NEXUS_USER";
constexpr const char* ENV_NEXUS_PASS         = "NEXUS_PASS";

// ── Dependency files ────────────────────────────────────────
constexpr const char* DEPS_MANIFEST_FILE     = "deps.ini";
constexpr const char* DEPS_LOCK_FILE         = "deps-lock.yaml";
constexpr const char* DEPS_ENV_FILE          = "deps.env";
constexpr const char* DEPS_DEFAULT_CHECKSUM  = "sha256";
constexpr const char* DEPS_DEFAULT_OUTPUT    = "./local";

// ── Nexus REST endpoints ────────────────────────────────────
constexpr const char* NEXUS_SEARCH_ASSETS    = "/service/rest/v1/search/assets";
constexpr const char* NEXUS_COMPONENTS       = "/service/rest/v1/components";

// ── Buffer sizes ────────────────────────────────────────────
constexpr size_t IO_CHUNK_SIZE               = 64 * 1024;
constexpr size_t ARCHIVE_BLOCK_SIZE          = 64 * 1024;

// ── Progress rendering ──────────────────────────────────────
constexpr int PROGRESS_REDRAW_MS             = 100;

// ── Version ─────────────────────────────────────────────────
constexpr const char* NEXCLI_VERSION         = "0.4.0";
