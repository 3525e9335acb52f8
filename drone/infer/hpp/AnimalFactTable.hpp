#ifndef ANIMAL_FACT_TABLE_HPP
#define ANIMAL_FACT_TABLE_HPP

#include <string>
#include <unordered_map>
#include "FrameTypes.hpp"

// 标签 -> 描述信息的只读查找表，启动时构建一次
class AnimalFactTable {
public:
    AnimalFactTable() = default;
    explicit AnimalFactTable(std::unordered_map<std::string, AnimalDetails> entries);

    // 内置的动物信息
    static AnimalFactTable builtin();

    // 标签不区分大小写；未知标签返回通用占位记录
    AnimalDetails lookup(const std::string& label) const;

    bool contains(const std::string& label) const;
    size_t size() const { return entries.size(); }

private:
    std::unordered_map<std::string, AnimalDetails> entries;

    static std::string toLower(const std::string& s);
    static std::string capitalize(const std::string& s);
};

#endif // ANIMAL_FACT_TABLE_HPP
