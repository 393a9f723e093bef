/**
 * @file puzzle.hpp
 * @brief 標準のルーンロック
 */
#ifndef RUNE_LOCK_PUZZLE_HPP
#define RUNE_LOCK_PUZZLE_HPP

#include "rune_lock/lock.hpp"

namespace rune_lock {

/**
 * @brief 標準パズルのロックを作成
 *
 * ルーン配置: Z S V C S V / C S V Z S V（外側、内側）
 * ルールは13個。
 */
Lock make_standard_lock();

} // namespace rune_lock

#endif // RUNE_LOCK_PUZZLE_HPP
