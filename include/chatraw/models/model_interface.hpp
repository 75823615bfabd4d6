#ifndef CHATRAW_MODEL_INTERFACE_HPP
#define CHATRAW_MODEL_INTERFACE_HPP

#include <nlohmann/json.hpp>

namespace chatraw
{

/**
 * @brief Common interface of the JSON request and response models
 */
class IModel
{
public:
    virtual ~IModel() = default;

    virtual bool validate() const = 0;

    virtual nlohmann::json to_json() const = 0;

    /**
     * @brief Populates the model from JSON
     * @throws std::runtime_error when a field has the wrong type
     */
    virtual void from_json(const nlohmann::json& j) = 0;
};

} // namespace chatraw

#endif // CHATRAW_MODEL_INTERFACE_HPP
