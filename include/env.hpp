#pragma once

namespace mjudge {

/**
 * @brief 将 error_codes 导出为环境变量
 * manager 可以通过 $E_ACCEPTED 和 $E_WRONG_ANSWER 获得约定的退出码
 */
void put_error_codes();

}  // namespace mjudge
