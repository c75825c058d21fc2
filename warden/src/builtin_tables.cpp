// Built-in ontology tables: allergen groups, interaction rules, safety index
//
// Version 1 of the shipped resource. Bump the version when a group, member
// or rule changes so stored violations can be traced to the table that
// produced them.

#include <warden/ontology.hpp>
#include <warden/interactions.hpp>
#include <warden/safety_index.hpp>

namespace warden {

namespace {

constexpr int BUILTIN_TABLE_VERSION = 1;

const std::vector<std::string> RETINOIDS = {
    "retinol", "retinyl palmitate", "retinaldehyde", "tretinoin", "adapalene"
};
const std::vector<std::string> VITAMIN_C = {"ascorbic acid", "l-ascorbic acid", "vitamin c"};

std::vector<AllergenGroup> builtin_groups() {
    return {
        {"paraben", {"methylparaben", "ethylparaben", "propylparaben", "butylparaben",
                     "isobutylparaben"}},
        {"sulfate", {"sodium lauryl sulfate", "sodium laureth sulfate", "sls", "sles",
                     "ammonium lauryl sulfate"}},
        {"fragrance", {"parfum", "fragrance", "aroma", "linalool", "limonene", "citronellol",
                       "geraniol", "eugenol", "coumarin"}},
        {"alcohol", {"alcohol denat", "alcohol denat.", "sd alcohol", "isopropyl alcohol",
                     "ethanol"}},
        {"formaldehyde", {"formaldehyde", "dmdm hydantoin", "imidazolidinyl urea",
                          "diazolidinyl urea", "quaternium-15"}},
        {"silicone", {"dimethicone", "cyclomethicone", "cyclopentasiloxane", "amodimethicone",
                      "trimethicone"}},
        {"mineral oil", {"mineral oil", "paraffinum liquidum", "petrolatum", "petroleum"}},
        {"retinol", RETINOIDS},
        {"aha", {"glycolic acid", "lactic acid", "mandelic acid", "citric acid", "malic acid"}},
        {"bha", {"salicylic acid", "beta hydroxy acid", "willow bark extract"}},
        {"coconut", {"cocamidopropyl betaine", "sodium coco-sulfate",
                     "caprylic/capric triglyceride", "coconut oil", "cocos nucifera oil"}},
        {"propylene_glycol", {"propylene glycol", "propanediol", "1,2-propanediol"}},
        {"phenoxyethanol", {"phenoxyethanol", "2-phenoxyethanol"}},
    };
}

std::vector<InteractionRule> builtin_rules() {
    return {
        {RETINOIDS, {"glycolic acid", "lactic acid", "mandelic acid", "malic acid"},
         InteractionSeverity::High, "Retinoid + AHA",
         "Retinoids + AHAs together can cause excessive irritation, peeling, "
         "and compromised skin barrier. Use on alternate days instead."},
        {RETINOIDS, {"salicylic acid"},
         InteractionSeverity::High, "Retinoid + BHA",
         "Retinoids + BHA (salicylic acid) together increase irritation risk "
         "and skin sensitivity. Best used at different times of day."},
        {RETINOIDS, {"benzoyl peroxide"},
         InteractionSeverity::High, "Retinoid + Benzoyl Peroxide",
         "Benzoyl peroxide can oxidize and deactivate retinol, "
         "reducing effectiveness of both. Apply at different times."},
        {VITAMIN_C, {"niacinamide"},
         InteractionSeverity::Low, "Vitamin C + Niacinamide",
         "Vitamin C + niacinamide was historically thought to cause flushing, "
         "but modern formulations are generally safe together. "
         "Some sensitive skin types may experience mild irritation."},
        {VITAMIN_C, RETINOIDS,
         InteractionSeverity::Medium, "Vitamin C + Retinoid",
         "Vitamin C and retinoids both work best at different pH levels. "
         "Using together may reduce efficacy. Apply vitamin C in the morning "
         "and retinoid at night."},
        {{"glycolic acid", "lactic acid", "mandelic acid"}, {"salicylic acid"},
         InteractionSeverity::Medium, "AHA + BHA",
         "AHA + BHA together can over-exfoliate, leading to dryness, "
         "redness, and barrier damage. Use on alternate days."},
        {{"benzoyl peroxide"}, VITAMIN_C,
         InteractionSeverity::High, "Benzoyl Peroxide + Vitamin C",
         "Benzoyl peroxide oxidizes vitamin C, rendering both less effective. "
         "Apply at different times of day."},
        {{"hydroquinone"}, {"benzoyl peroxide"},
         InteractionSeverity::Medium, "Hydroquinone + Benzoyl Peroxide",
         "Benzoyl peroxide can temporarily stain skin dark when combined "
         "with hydroquinone. Apply at different times."},
        {{"glycolic acid", "lactic acid", "mandelic acid", "salicylic acid"}, VITAMIN_C,
         InteractionSeverity::Medium, "Exfoliating Acid + Vitamin C",
         "Using exfoliating acids with vitamin C can increase sensitivity "
         "and reduce vitamin C stability. Layer carefully or use at different times."},
        {{"niacinamide"}, {"glycolic acid", "lactic acid", "mandelic acid", "salicylic acid"},
         InteractionSeverity::Low, "Niacinamide + Direct Acid",
         "Niacinamide + direct acids at low pH may cause temporary flushing. "
         "Wait a few minutes between applications or use at different times."},
    };
}

} // namespace

const AllergenOntology& AllergenOntology::builtin() {
    static const AllergenOntology ontology(BUILTIN_TABLE_VERSION, builtin_groups());
    return ontology;
}

const InteractionTable& InteractionTable::builtin() {
    static const InteractionTable table(BUILTIN_TABLE_VERSION, builtin_rules());
    return table;
}

const SafetyIndex& SafetyIndex::builtin() {
    static const SafetyIndex index(
        {
            {"sodium lauryl sulfate", {"high", "skin irritant, disrupts skin barrier"}},
            {"sodium laureth sulfate", {"medium", "potential irritant, drying"}},
            {"alcohol denat", {"medium", "drying, can irritate sensitive skin"}},
            {"alcohol denat.", {"medium", "drying, can irritate sensitive skin"}},
            {"fragrance", {"medium", "common allergen, undisclosed chemicals"}},
            {"parfum", {"medium", "common allergen, undisclosed chemicals"}},
            {"formaldehyde", {"high", "known carcinogen"}},
            {"dmdm hydantoin", {"high", "formaldehyde releaser"}},
            {"methylisothiazolinone", {"high", "strong sensitizer"}},
            {"methylchloroisothiazolinone", {"high", "strong sensitizer"}},
            {"triclosan", {"high", "endocrine disruptor"}},
            {"toluene", {"high", "toxic, reproductive concerns"}},
            {"hydroquinone", {"high", "potential carcinogen, skin irritant"}},
            {"oxybenzone", {"medium", "endocrine disruptor, photoallergic"}},
            {"octinoxate", {"medium", "endocrine disruptor"}},
        },
        {
            {"coconut oil", 4},
            {"cocoa butter", 4},
            {"wheat germ oil", 5},
            {"isopropyl myristate", 5},
            {"isopropyl palmitate", 4},
            {"lanolin", 4},
            {"acetylated lanolin", 4},
            {"soybean oil", 3},
            {"corn oil", 3},
            {"myristyl myristate", 5},
            {"oleic acid", 3},
            {"lauric acid", 4},
        });
    return index;
}

} // namespace warden
