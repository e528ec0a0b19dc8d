#pragma once

#include <filesystem>
#include "copy_types.hpp"
#include "copy_engine/strategy.hpp"
#include "../adapters/fs.hpp"
#include "../infra/error_handler/error.hpp"

namespace cverify::core {

/// Публичная точка входа: проверка путей, выбор стратегии, копирование,
/// независимая верификация назначения, перенос метаданных.
///
/// Операция однопоточная и выполняется целиком в вызывающем потоке.
/// Несколько операций над разными файлами можно запускать параллельно:
/// общего изменяемого состояния у них нет, кроме OperationControl.
class CopyVerifyOperation {
public:
    explicit CopyVerifyOperation(const adapters::fs::FileSystem& fs = adapters::fs::posix_file_system(),
                                 CopyStrategySelector selector = CopyStrategySelector{});

    [[nodiscard]] auto execute(const CopyRequest& request, const OperationControl& control) const
        -> infra::Result<CopyOutcome>;

private:
    const adapters::fs::FileSystem& fs_;
    CopyStrategySelector selector_;
};

} // namespace cverify::core
