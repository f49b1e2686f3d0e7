#pragma once

// Russian string table - included by i18n.hpp after Strings is defined

inline constexpr Strings RU_STRINGS_DEF = {
    // General
    "Менеджер Telegram-бота",
    "Неизвестная команда: ",
    "Некорректный файл конфигурации, используются значения по умолчанию: ",

    // Status
    "Бот запущен",
    "Найден lockfile, но процесс не работает",
    "Бот не запущен",
    "Логи: tail -f ",
    "Остановить: botctl stop",
    "Запустить: botctl start",
    "Очистка: botctl stop или удалите ",

    // Start
    "Бот уже запущен",
    "Удаление старого lockfile, предыдущий запуск завершился некорректно...",
    "Скрипт бота не найден: ",
    "Файл окружения не найден: ",
    "Создайте его с BOT_TOKEN=ваш_токен",
    "Запуск бота...",
    "Бот запущен",
    "Не удалось запустить бота: ",
    "Не удалось записать lockfile: ",
    "Другой экземпляр занял lockfile первым, новый процесс остановлен",

    // Environment
    "Создание виртуального окружения...",
    "Виртуальное окружение создано",
    "Виртуальное окружение не найдено",
    "Файл зависимостей не найден: ",
    "Проверьте путь к файлу зависимостей (runtime.manifest в botctl.yaml)",
    "Первая установка зависимостей...",
    "Обнаружены изменения в файле зависимостей, обновление...",
    "Зависимости повреждены, переустановка...",
    "Принудительное обновление зависимостей...",
    "Зависимости установлены",
    "Зависимости актуальны",
    "Ошибка установки зависимостей",
    "Исправьте файл зависимостей или сеть и повторите команду",

    // Stop
    "Остановка бота",
    "Бот не завершился вовремя, принудительная остановка...",
    "Бот остановлен",
    "Бот уже остановлен",
    "Очистка старого lockfile...",
    "Готово",
    "Не удалось отправить сигнал процессу бота: ",

    // Restart / update
    "Перезапуск бота...",
    "Сначала запустите: botctl start",
    "Зависимости обновлены",
    "Перезапустите бота: botctl restart",
};
