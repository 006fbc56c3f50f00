#pragma once

#include "meadow/core/types.h"

#include <optional>
#include <string>
#include <unordered_map>

namespace Meadow {

class CropCatalog;
class IFeedbackSink;
struct PlayerState;

// ── 商店 ──────────────────────────────────────────────────
//
// 只负责经济状态变化: 买种子 (扣钱加种子), 卖物品 (扣物品加钱)。
// 钱或物品不足时拒绝, 不做任何修改。

class Shop {
public:
    Shop(const CropCatalog& catalog, std::unordered_map<std::string, u32> extraSellPrices);

    void SetFeedback(IFeedbackSink* sink);

    std::optional<u32> GetBuyPrice(const std::string& seedID) const;
    std::optional<u32> GetSellPrice(const std::string& itemID) const;

    bool BuySeed(PlayerState& player, const std::string& seedID, u32 count = 1);
    bool Sell(PlayerState& player, const std::string& itemID, u32 count = 1);

    /// 卖掉背包里所有有价格的物品, 返回总收入
    u32 SellAll(PlayerState& player);

private:
    const CropCatalog& m_Catalog;
    std::unordered_map<std::string, u32> m_ExtraSellPrices;
    IFeedbackSink* m_Feedback;
};

} // namespace Meadow
