#include "infrastructure/PromptCatalog.hpp"
#include "infrastructure/JsonMapping.hpp"

namespace trialguard::infrastructure {

namespace {

const char* kExtractionPrompt =
    "You are a medical data extraction assistant. Extract structured patient information from free-text clinical notes.\n\n"
    "Extract the following fields:\n"
    "- age: number (in years)\n"
    "- gender: 'male' | 'female' | 'other' | 'unknown'\n"
    "- conditions: string[] (diagnoses, diseases, medical conditions)\n"
    "- medications: string[] (current medications)\n"
    "- allergies: string[] (known allergies)\n"
    "- biomarkers: Record<string, string> (e.g., HER2+, EGFR mutation, etc.)\n"
    "- stage: string | null (cancer stage if applicable, e.g., \"Stage II\", \"Stage IIIA\")\n"
    "- priorTreatments: string[] (previous therapies, surgeries, etc.)\n"
    "- performanceStatus: string | null (ECOG, Karnofsky if mentioned)\n"
    "- labValues: Record<string, string> (e.g., \"hemoglobin: 12.5 g/dL\")\n\n"
    "Rules:\n"
    "- Use medical terminology standardization (map synonyms to standard terms)\n"
    "- If information is missing, use null or empty array\n"
    "- Preserve exact biomarker notation (e.g., \"HER2+\", \"BRCA1 mutation\")\n"
    "- Extract numeric values with units for lab results\n"
    "- Return valid JSON only, no additional text\n\n"
    "Example input: \"45yo female, breast cancer stage II, HER2+, on tamoxifen, ECOG 1\"\n\n"
    "Example output:\n"
    "{\"age\": 45, \"gender\": \"female\", \"conditions\": [\"breast cancer\"], \"medications\": [\"tamoxifen\"], "
    "\"allergies\": [], \"biomarkers\": {\"HER2\": \"positive\"}, \"stage\": \"Stage II\", \"priorTreatments\": [], "
    "\"performanceStatus\": \"ECOG 1\", \"labValues\": {}}\n\n"
    "Now extract from this input:";

const char* kAssessmentPrompt =
    "You are a clinical trial matching assistant. Assess how well a patient fits a clinical trial's eligibility "
    "criteria and explain your reasoning.\n\n"
    "Provide:\n"
    "1. matchScore (0-100): Overall fit percentage\n"
    "2. confidenceLevel: 'high' | 'medium' | 'low'\n"
    "3. inclusionMatches: Which inclusion criteria the patient meets\n"
    "4. exclusionFlags: Which exclusion criteria might disqualify the patient\n"
    "5. uncertainFactors: Criteria that need clarification\n"
    "6. explanation: Plain-language summary for clinicians\n"
    "7. questionsToAsk: Specific questions clinicians should ask the patient\n\n"
    "Rules:\n"
    "- Be conservative: Flag potential exclusions even if uncertain\n"
    "- HARD EXCLUSION CAP: If any exclusion criteria are definitively matched (e.g., patient has prior therapy that "
    "trial excludes), set matchScore to maximum 25 regardless of how well other criteria match. Prioritize safety "
    "over enrollment.\n"
    "- Use medical terminology but keep explanations clear\n"
    "- Highlight critical mismatches (e.g., age, stage, biomarkers)\n"
    "- Note when information is missing or ambiguous\n"
    "- Return valid JSON only\n\n"
    "Now assess this patient-trial pair:";

const char* kTrialGenerationPrompt =
    "You are a clinical trial database generator. Create 3 realistic breast cancer clinical trials for "
    "demonstration purposes.\n\n"
    "Generate exactly 3 trials covering these scenarios:\n"
    "1. PERFECT MATCH: A trial the patient clearly qualifies for.\n"
    "2. HARD EXCLUSION: A trial with an exclusion criterion the patient fails immediately.\n"
    "3. UNCERTAIN: A borderline trial needing clinician judgment.\n\n"
    "Each trial must include:\n"
    "- nctId: string (format \"NCT\" + 8 random digits, e.g., \"NCT04567890\")\n"
    "- title: string (realistic trial name with drug/intervention)\n"
    "- phase: \"Phase 1\" | \"Phase 2\" | \"Phase 3\"\n"
    "- briefSummary: string (2 sentences max, describe intervention and target population)\n"
    "- inclusionCriteria: string[] (3-5 specific bullet points)\n"
    "- exclusionCriteria: string[] (3-5 specific bullet points)\n"
    "- cancerType: \"breast\" | \"lung\" | \"colorectal\" | \"prostate\" | \"other\"\n"
    "- matchType: \"perfect\" | \"excluded\" | \"uncertain\"\n"
    "- matchScore: number (0-100, pre-calculated: perfect=90-95, excluded=15-25, uncertain=55-65)\n\n"
    "Requirements:\n"
    "- Use realistic drug names (e.g., trastuzumab deruxtecan, tucatinib, neratinib)\n"
    "- Include specific biomarker requirements (HER2+, ER/PR status)\n"
    "- Mention age ranges, stage requirements, performance status\n"
    "- Return a JSON object of the form {\"trials\": [...]} only, no additional text\n\n"
    "Now generate 3 trials for this patient:";

} // namespace

std::string PromptCatalog::BuildExtractionPrompt(const std::string& freeText) {
    return std::string(kExtractionPrompt) + "\n\n\"" + freeText + "\"";
}

std::string PromptCatalog::BuildAssessmentPrompt(const domain::clinical::PatientProfile& profile,
                                                 const domain::clinical::TrialRecord& trial) {
    const nlohmann::ordered_json criteria = {
        {"inclusion", trial.inclusionCriteria},
        {"exclusion", trial.exclusionCriteria}
    };
    return std::string(kAssessmentPrompt) +
           "\n\nPatient:\n" + JsonMapping::ProfileToJson(profile).dump(2) +
           "\n\nTrial Criteria:\n" + criteria.dump(2);
}

std::string PromptCatalog::BuildTrialGenerationPrompt(const std::string& patientText) {
    return std::string(kTrialGenerationPrompt) + "\n\nPatient: " + patientText;
}

} // namespace trialguard::infrastructure
