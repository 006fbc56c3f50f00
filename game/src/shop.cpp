#include "game/shop.h"
#include "game/crop.h"
#include "game/feedback.h"
#include "game/player_state.h"
#include "meadow/core/log.h"

#include <algorithm>
#include <limits>
#include <vector>

namespace Meadow {

Shop::Shop(const CropCatalog& catalog, std::unordered_map<std::string, u32> extraSellPrices)
    : m_Catalog(catalog), m_ExtraSellPrices(std::move(extraSellPrices)),
      m_Feedback(&NullFeedbackSink::Get()) {}

void Shop::SetFeedback(IFeedbackSink* sink) {
    m_Feedback = sink ? sink : &NullFeedbackSink::Get();
}

std::optional<u32> Shop::GetBuyPrice(const std::string& seedID) const {
    auto* def = m_Catalog.Find(seedID);
    if (!def) return std::nullopt;
    return def->SeedPrice;
}

std::optional<u32> Shop::GetSellPrice(const std::string& itemID) const {
    if (auto* def = m_Catalog.Find(itemID)) return def->SellPrice;
    auto it = m_ExtraSellPrices.find(itemID);
    if (it == m_ExtraSellPrices.end()) return std::nullopt;
    return it->second;
}

bool Shop::BuySeed(PlayerState& player, const std::string& seedID, u32 count) {
    auto price = GetBuyPrice(seedID);
    if (!price || count == 0) return false;

    i64 cost = (i64)*price * count;
    if (player.Money < cost) {
        LOG_DEBUG("[商店] 钱不够买 %s x%u (需要 %lld, 现有 %d)",
                  seedID.c_str(), count, (long long)cost, player.Money);
        return false;
    }
    player.Money -= (i32)cost;
    player.Seeds.AddItem(seedID, count);
    m_Feedback->PlaySound(SoundCue::Purchase);
    m_Feedback->ShowToast("买入 " + seedID + " x" + std::to_string(count));
    LOG_INFO("[商店] 买入 %s x%u, 花费 %lld", seedID.c_str(), count, (long long)cost);
    return true;
}

bool Shop::Sell(PlayerState& player, const std::string& itemID, u32 count) {
    auto price = GetSellPrice(itemID);
    if (!price || count == 0) return false;
    if (!player.Items.HasItem(itemID, count)) return false;

    // 金钱封顶在 i32 上限
    i64 income = (i64)*price * count;
    i64 money = std::min<i64>((i64)player.Money + income, std::numeric_limits<i32>::max());
    player.Items.RemoveItem(itemID, count);
    player.Money = (i32)money;
    m_Feedback->PlaySound(SoundCue::Purchase);
    m_Feedback->ShowToast("卖出 " + itemID + " x" + std::to_string(count));
    LOG_INFO("[商店] 卖出 %s x%u, 收入 %lld", itemID.c_str(), count, (long long)income);
    return true;
}

u32 Shop::SellAll(PlayerState& player) {
    // 先收集再卖, 避免边遍历边修改
    std::vector<std::pair<std::string, u32>> lots;
    for (auto& [id, count] : player.Items.GetAll()) {
        if (count > 0 && GetSellPrice(id)) lots.emplace_back(id, count);
    }

    u64 total = 0;
    for (auto& [id, count] : lots) {
        if (Sell(player, id, count)) total += (u64)*GetSellPrice(id) * count;
    }
    return (u32)std::min<u64>(total, std::numeric_limits<u32>::max());
}

} // namespace Meadow
