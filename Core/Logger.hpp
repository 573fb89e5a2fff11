#pragma once
// Logger.hpp — Boost.Log: консоль, файл с ротацией, syslog.
// Публичный API — в namespace Logger. Макросы — глобально.

#include <string>
#include <cstddef>
#include <optional>

#include <boost/log/trivial.hpp>

namespace Logger
{
    /// @brief Уровни важности (trace < debug < info < warning < error < fatal).
    using severity_t = boost::log::trivial::severity_level;

    /**
     * @brief Опции инициализации логирования.
     */
    struct Options
    {
        /// @brief Идентификатор приложения (используется как ident для syslog).
        std::string app_name = "tunredirect";

        /// @brief Каталог для файловых логов. Пустая строка — файл не пишем.
        std::string directory;

        /// @brief Базовое имя файлов лога.
        std::string base_filename = "tunredirect";

        /// @brief Вывод в консоль (std::clog).
        bool enable_console = true;

        /// @brief Дублировать сообщения в syslog (facility daemon).
        bool enable_syslog = false;

        /// @brief Минимальный уровень для всех sinks.
        severity_t min_severity = boost::log::trivial::info;

        /// @brief Размер файла для ротации (байты).
        std::size_t rotation_size_bytes = 8ull * 1024 * 1024; // 8 MB

        /// @brief Максимальный суммарный размер логов в каталоге (байты).
        std::size_t max_total_size_bytes = 256ull * 1024 * 1024; // 256 MB
    };

    /**
     * @brief RAII-гвард логирования. В конструкторе — init, в деструкторе — flush/remove.
     * @details Один экземпляр на процесс (в начале main()).
     */
    class Guard
    {
    public:
        explicit Guard(const Options &opts);
        ~Guard();

        Guard(const Guard &) = delete;
        Guard &operator=(const Guard &) = delete;

        /**
         * @brief Переприменяет минимальный уровень ко всем sinks.
         * @details Нужен после чтения конфигурации: гвард создаётся раньше неё.
         */
        void SetMinSeverity(severity_t level);

        /// @brief Подключает файловый sink (если ещё не подключён).
        void EnableFile(const std::string &directory);

        /// @brief Подключает syslog sink (если ещё не подключён).
        void EnableSyslog();

    private:
        Options opts_;
    };

    /**
     * @brief Разбирает имя уровня ("debug", "WARN", "error", ...).
     * @return std::nullopt для неизвестного имени.
     */
    std::optional<severity_t> ParseSeverity(const std::string &name);

    /// @brief Принудительный сброс буферов.
    void FlushAll();
}

/**
 * @brief Лог одной строкой с тэгом перед сообщением.
 * Пример: LOGI("routing") << "Table ready";  // => ... [info] [routing] Table ready
 */
#define LOGT(TAG) BOOST_LOG_TRIVIAL(trace)  << "[" << (TAG) << "] "
#define LOGD(TAG) BOOST_LOG_TRIVIAL(debug)  << "[" << (TAG) << "] "
#define LOGI(TAG) BOOST_LOG_TRIVIAL(info)   << "[" << (TAG) << "] "
#define LOGW(TAG) BOOST_LOG_TRIVIAL(warning)<< "[" << (TAG) << "] "
#define LOGE(TAG) BOOST_LOG_TRIVIAL(error)  << "[" << (TAG) << "] "
#define LOGF(TAG) BOOST_LOG_TRIVIAL(fatal)  << "[" << (TAG) << "] "
