#ifndef TREE_IPRUNER_HPP
#define TREE_IPRUNER_HPP

#include <memory>
#include "Node.hpp"

class IPruner {
public:
    virtual ~IPruner() = default;
    /** 后剪枝入口（预剪枝由训练器在分裂时查询） */
    virtual void prune(std::unique_ptr<Node>& root) const = 0;

    /** 预剪枝阈值：分裂增益低于它时直接成叶，0 表示不限制 */
    virtual double minGain() const { return 0.0; }
};

#endif // TREE_IPRUNER_HPP
