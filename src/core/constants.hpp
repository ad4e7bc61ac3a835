#pragma once

// ── Chat program invocation ─────────────────────────────────
constexpr const char* DEFAULT_EXECUTABLE   = "q";
constexpr const char* DEFAULT_SUBCOMMAND   = "chat";
constexpr const char* TRUST_TOOLS_FLAG     = "--trust-tools=";
constexpr const char* QUIT_DIRECTIVE       = "/quit\n";
constexpr const char* DEFAULT_WORKDIR_NAME = "amazon-q";   // under $HOME

// ── Environment ─────────────────────────────────────────────
// Q_LOG_LEVEL is always exported; the rest only fill gaps in the caller's env.
constexpr const char* ENV_LOG_LEVEL        = "Q_LOG_LEVEL";
constexpr const char* DEFAULT_TERM         = "xterm-256color";
constexpr const char* DEFAULT_LOCALE       = "C.UTF-8";

// ── Prompt spellings ────────────────────────────────────────
constexpr const char* PROMPT_LONG          = "Amazon Q>";
constexpr const char* PROMPT_SHORT         = ">";

// ── Turn protocol ───────────────────────────────────────────
// An unfinished "Allow this action?" is held back from the reply until the
// rest of the question arrives or this many more lines go by.
constexpr int NARRATIVE_HOLD_LINES         = 3;

// ── Buffer sizes ────────────────────────────────────────────
constexpr int RELAY_READ_BUF_SIZE          = 4096;
constexpr int RELAY_PARTIAL_FLUSH_MS       = 50;    // flush an unterminated line after this much quiet

// ── Logging ─────────────────────────────────────────────────
constexpr int LOG_SEND_PREVIEW_CHARS       = 80;
constexpr const char* LOG_FILE_PREFIX      = "qchat_";

// ── Config ──────────────────────────────────────────────────
constexpr const char* GLOBAL_CONFIG_DIR    = ".qbridge";      // under $HOME
constexpr const char* CONFIG_FILE_NAME     = "config.yaml";
constexpr const char* PROJECT_CONFIG_NAME  = "qbridge.yaml";
